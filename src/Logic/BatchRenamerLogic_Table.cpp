#include "BatchRenamerLogic.h"

#include <wx/datetime.h>
#include <wx/log.h>
#include <wx/mstream.h>
#include <wx/wfstream.h>
#include <wx/xml/xml.h>
#include <wx/zipstrm.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <optional>
#include <algorithm>
#include <memory>
#include <string>
#include <vector>
#include <cctype>
#include <cmath>
#include <system_error> // For std::error_code
#include <stdexcept>

namespace fs = std::filesystem;

namespace
{
	std::string ToUtf8(const wxString &s)
	{
		const wxScopedCharBuffer buffer = s.utf8_str();
		return std::string(buffer.data(), buffer.length());
	}

	// Reads every XML part of the package into memory, keyed by its archive path
	bool ReadPackageParts(const fs::path &workbookPath, std::map<std::string, std::string> &parts, std::string &error)
	{
		wxFFileInputStream fileStream(wxString(workbookPath.wstring()));
		if (!fileStream.IsOk())
		{
			error = "Cannot open workbook: " + workbookPath.u8string();
			return false;
		}
		wxZipInputStream zip(fileStream);
		if (!zip.IsOk())
		{
			error = "Workbook is not a valid zip archive: " + workbookPath.u8string();
			return false;
		}

		std::unique_ptr<wxZipEntry> entry;
		for (entry.reset(zip.GetNextEntry()); entry; entry.reset(zip.GetNextEntry()))
		{
			if (entry->IsDir())
			{
				continue;
			}
			const std::string name = ToUtf8(entry->GetName(wxPATH_UNIX));
			std::string content;
			char buffer[8192];
			do
			{
				zip.Read(buffer, sizeof(buffer));
				content.append(buffer, zip.LastRead());
			} while (zip.LastRead() > 0);
			if (zip.GetLastError() == wxSTREAM_READ_ERROR)
			{
				error = "Corrupt entry '" + name + "' in workbook " + workbookPath.u8string();
				return false;
			}
			parts[name] = content;
		}
		if (zip.GetLastError() == wxSTREAM_READ_ERROR)
		{
			error = "Failed reading workbook archive: " + workbookPath.u8string();
			return false;
		}
		if (parts.empty())
		{
			error = "Workbook archive is empty: " + workbookPath.u8string();
			return false;
		}
		return true;
	}

	bool ParseXml(const std::string &content, wxXmlDocument &doc)
	{
		wxMemoryInputStream stream(content.data(), content.size());
		return doc.Load(stream, "UTF-8", wxXMLDOC_KEEP_WHITESPACE_NODES) && doc.GetRoot() != nullptr;
	}

	wxXmlNode *FirstChildElement(wxXmlNode *parent, const wxString &name)
	{
		for (wxXmlNode *child = parent ? parent->GetChildren() : nullptr; child; child = child->GetNext())
		{
			if (child->GetType() == wxXML_ELEMENT_NODE && child->GetName() == name)
			{
				return child;
			}
		}
		return nullptr;
	}

	// Concatenates all <t> runs below a node, skipping phonetic (<rPh>) hints
	void CollectText(wxXmlNode *node, std::string &out)
	{
		for (wxXmlNode *child = node->GetChildren(); child; child = child->GetNext())
		{
			if (child->GetType() != wxXML_ELEMENT_NODE)
			{
				continue;
			}
			if (child->GetName() == "t")
			{
				out += ToUtf8(child->GetNodeContent());
			}
			else if (child->GetName() != "rPh")
			{
				CollectText(child, out);
			}
		}
	}

	// Finds the relationship id of the first worksheet declared in workbook.xml
	std::string FirstSheetRelationshipId(wxXmlNode *workbookRoot)
	{
		wxXmlNode *sheets = FirstChildElement(workbookRoot, "sheets");
		wxXmlNode *sheet = FirstChildElement(sheets, "sheet");
		if (!sheet)
		{
			return "";
		}
		// The namespace prefix is whatever the writer chose, so match on the local name
		for (wxXmlAttribute *attr = sheet->GetAttributes(); attr; attr = attr->GetNext())
		{
			const wxString attrName = attr->GetName();
			if (attrName == "id" || attrName.EndsWith(":id"))
			{
				return ToUtf8(attr->GetValue());
			}
		}
		return "";
	}

	std::string ResolveSheetPart(const std::map<std::string, std::string> &parts)
	{
		const std::string fallback = "xl/worksheets/sheet1.xml";
		auto workbookIt = parts.find("xl/workbook.xml");
		auto relsIt = parts.find("xl/_rels/workbook.xml.rels");
		if (workbookIt == parts.end() || relsIt == parts.end())
		{
			return fallback;
		}

		wxXmlDocument workbookDoc;
		wxXmlDocument relsDoc;
		if (!ParseXml(workbookIt->second, workbookDoc) || !ParseXml(relsIt->second, relsDoc))
		{
			return fallback;
		}
		const std::string relId = FirstSheetRelationshipId(workbookDoc.GetRoot());
		if (relId.empty())
		{
			return fallback;
		}
		for (wxXmlNode *rel = relsDoc.GetRoot()->GetChildren(); rel; rel = rel->GetNext())
		{
			if (rel->GetType() != wxXML_ELEMENT_NODE || rel->GetName() != "Relationship")
			{
				continue;
			}
			if (ToUtf8(rel->GetAttribute("Id")) != relId)
			{
				continue;
			}
			std::string target = ToUtf8(rel->GetAttribute("Target"));
			if (!target.empty() && target[0] == '/')
			{
				return target.substr(1); // Absolute part name
			}
			return "xl/" + target;
		}
		return fallback;
	}

	std::vector<std::string> LoadSharedStrings(const std::map<std::string, std::string> &parts)
	{
		std::vector<std::string> strings;
		auto it = parts.find("xl/sharedStrings.xml");
		if (it == parts.end())
		{
			return strings;
		}
		wxXmlDocument doc;
		if (!ParseXml(it->second, doc))
		{
			return strings;
		}
		for (wxXmlNode *si = doc.GetRoot()->GetChildren(); si; si = si->GetNext())
		{
			if (si->GetType() == wxXML_ELEMENT_NODE && si->GetName() == "si")
			{
				std::string text;
				CollectText(si, text);
				strings.push_back(text);
			}
		}
		return strings;
	}

	// Cell styles whose number format shows a date or time, and the workbook's date system
	struct DateStyles
	{
		std::vector<bool> IsDate; // Indexed by the cell's s attribute
		bool Epoch1904 = false;

		bool Applies(wxXmlNode *cell) const
		{
			unsigned long style = 0;
			return cell->GetAttribute("s").ToULong(&style) && style < IsDate.size() && IsDate[style];
		}
	};

	bool IsBuiltInDateFormat(long id)
	{
		return (id >= 14 && id <= 22) || (id >= 27 && id <= 36) || (id >= 45 && id <= 47) || (id >= 50 && id <= 58);
	}

	// Looks for y/m/d/h/s tokens in the first section of a format code, outside
	// quoted literals, escapes and [..] modifiers
	bool IsDateFormatCode(const std::string &code)
	{
		bool quoted = false;
		for (std::size_t i = 0; i < code.size(); ++i)
		{
			const char c = code[i];
			if (quoted)
			{
				quoted = c != '"';
				continue;
			}
			switch (c)
			{
			case '"':
				quoted = true;
				break;
			case '\\':
			case '_':
			case '*':
				++i;
				break;
			case '[':
				i = code.find(']', i);
				if (i == std::string::npos)
					return false;
				break;
			case ';':
				return false;
			default:
				switch (std::tolower(static_cast<unsigned char>(c)))
				{
				case 'y':
				case 'm':
				case 'd':
				case 'h':
				case 's':
					return true;
				}
			}
		}
		return false;
	}

	DateStyles LoadDateStyles(const std::map<std::string, std::string> &parts)
	{
		DateStyles styles;
		auto workbookIt = parts.find("xl/workbook.xml");
		wxXmlDocument workbookDoc;
		if (workbookIt != parts.end() && ParseXml(workbookIt->second, workbookDoc))
		{
			wxXmlNode *properties = FirstChildElement(workbookDoc.GetRoot(), "workbookPr");
			const wxString date1904 = properties ? properties->GetAttribute("date1904", "0") : wxString("0");
			styles.Epoch1904 = date1904 == "1" || date1904 == "true";
		}

		auto it = parts.find("xl/styles.xml");
		wxXmlDocument doc;
		if (it == parts.end() || !ParseXml(it->second, doc))
		{
			return styles;
		}

		std::map<long, bool> customFormats;
		wxXmlNode *numFmts = FirstChildElement(doc.GetRoot(), "numFmts");
		for (wxXmlNode *fmt = numFmts ? numFmts->GetChildren() : nullptr; fmt; fmt = fmt->GetNext())
		{
			long id = 0;
			if (fmt->GetType() == wxXML_ELEMENT_NODE && fmt->GetName() == "numFmt" && fmt->GetAttribute("numFmtId").ToLong(&id))
			{
				customFormats[id] = IsDateFormatCode(ToUtf8(fmt->GetAttribute("formatCode")));
			}
		}

		wxXmlNode *cellXfs = FirstChildElement(doc.GetRoot(), "cellXfs");
		for (wxXmlNode *xf = cellXfs ? cellXfs->GetChildren() : nullptr; xf; xf = xf->GetNext())
		{
			if (xf->GetType() != wxXML_ELEMENT_NODE || xf->GetName() != "xf")
			{
				continue;
			}
			long id = 0;
			bool isDate = false;
			if (xf->GetAttribute("numFmtId", "0").ToLong(&id))
			{
				auto custom = customFormats.find(id);
				isDate = custom != customFormats.end() ? custom->second : IsBuiltInDateFormat(id);
			}
			styles.IsDate.push_back(isDate);
		}
		return styles;
	}

	// Serial day number -> "YYYY-MM-DD HH:MM:SS"
	std::string FormatSerialDate(double serial, bool epoch1904)
	{
		// Day 0 is 1899-12-30 in the 1900 system (which counts a nonexistent 1900-02-29)
		// and 1904-01-01 in the 1904 system
		if (!epoch1904 && serial < 60)
		{
			serial += 1;
		}
		const double epochJdn = epoch1904 ? 2416480.5 : 2415018.5;
		const long long seconds = std::llround(serial * 86400.0);
		wxDateTime moment(epochJdn + static_cast<double>(seconds / 86400));
		moment += wxTimeSpan::Seconds(seconds % 86400);
		return ToUtf8(moment.Format("%Y-%m-%d %H:%M:%S", wxDateTime::UTC));
	}

	// Worksheet limits: columns A..XFD, rows 1..1048576
	const std::size_t MaxColumns = 16384;
	const long MaxRows = 1048576;

	// "BC12" -> 54 (0-based column of the cell reference); MaxColumns or more when out of range
	std::optional<std::size_t> ColumnFromReference(const std::string &reference)
	{
		std::size_t column = 0;
		std::size_t letters = 0;
		for (char c : reference)
		{
			if (!std::isalpha(static_cast<unsigned char>(c)))
			{
				break;
			}
			if (++letters > 3)
			{
				return MaxColumns;
			}
			column = column * 26 + static_cast<std::size_t>(std::toupper(static_cast<unsigned char>(c)) - 'A' + 1);
		}
		if (letters == 0)
		{
			return std::nullopt;
		}
		return column - 1;
	}

	CellValue NumericCell(const std::string &raw)
	{
		const std::string text = BatchRenamerLogic::Trim(raw);
		if (text.empty())
		{
			return CellValue();
		}
		const bool looksReal = text.find_first_of(".eE") != std::string::npos;
		try
		{
			if (!looksReal)
			{
				return CellValue::FromInteger(std::stoll(text));
			}
			return CellValue::FromReal(std::stod(text));
		}
		catch (const std::exception &)
		{
			return CellValue::FromText(text);
		}
	}

	CellValue ReadCell(wxXmlNode *cell, const std::vector<std::string> &sharedStrings, const DateStyles &dates)
	{
		const wxString type = cell->GetAttribute("t", "n");
		if (type == "inlineStr")
		{
			wxXmlNode *is = FirstChildElement(cell, "is");
			std::string text;
			if (is)
			{
				CollectText(is, text);
			}
			return CellValue::FromText(text);
		}

		wxXmlNode *v = FirstChildElement(cell, "v");
		if (!v)
		{
			return CellValue();
		}
		const std::string raw = ToUtf8(v->GetNodeContent());
		if (type == "s")
		{
			try
			{
				const std::size_t index = static_cast<std::size_t>(std::stoul(raw));
				if (index < sharedStrings.size())
				{
					return CellValue::FromText(sharedStrings[index]);
				}
			}
			catch (const std::exception &)
			{
			}
			wxLogWarning("Shared string reference '%s' is out of range", raw.c_str());
			return CellValue();
		}
		if (type == "b")
		{
			return CellValue::FromBoolean(BatchRenamerLogic::Trim(raw) == "1");
		}
		if (type == "str" || type == "e" || type == "d")
		{
			return CellValue::FromText(raw);
		}
		CellValue number = NumericCell(raw);
		if (dates.Applies(cell) && (number.Kind == CellKind::Integer || number.Kind == CellKind::Real))
		{
			const double serial = number.Kind == CellKind::Integer ? static_cast<double>(number.Integer) : number.Real;
			if (serial >= 0 && serial < 2958466) // Through 9999-12-31
			{
				return CellValue::FromText(FormatSerialDate(serial, dates.Epoch1904));
			}
		}
		return number;
	}

	bool RowIsBlank(const std::vector<CellValue> &row)
	{
		for (const auto &cell : row)
		{
			if (cell.Kind != CellKind::Empty)
			{
				return false;
			}
		}
		return true;
	}

	// Turns the first row into column names and pads every other row to the header width
	void BuildTable(std::vector<std::vector<CellValue>> grid, DataTable &table)
	{
		while (!grid.empty() && RowIsBlank(grid.back()))
		{
			grid.pop_back();
		}
		if (grid.empty())
		{
			return;
		}

		std::size_t width = 0;
		for (const auto &row : grid)
		{
			width = std::max(width, row.size());
		}
		const std::vector<CellValue> &header = grid.front();
		for (std::size_t col = 0; col < width; ++col)
		{
			std::string name = col < header.size() ? BatchRenamerLogic::FormatCellValue(header[col]) : "";
			if (name.empty())
			{
				name = "Unnamed: " + std::to_string(col);
			}
			table.Columns.push_back(name);
		}
		for (std::size_t r = 1; r < grid.size(); ++r)
		{
			std::vector<CellValue> row = std::move(grid[r]);
			row.resize(width);
			table.Rows.push_back(std::move(row));
		}
	}

	std::vector<std::vector<std::string>> SplitDelimited(const std::string &content, char delimiter)
	{
		std::vector<std::vector<std::string>> records;
		std::vector<std::string> record;
		std::string field;
		bool inQuotes = false;
		bool fieldStarted = false;

		for (std::size_t i = 0; i < content.size(); ++i)
		{
			const char c = content[i];
			if (inQuotes)
			{
				if (c == '"')
				{
					if (i + 1 < content.size() && content[i + 1] == '"')
					{
						field += '"';
						++i;
					}
					else
					{
						inQuotes = false;
					}
				}
				else
				{
					field += c;
				}
				continue;
			}
			if (c == '"' && field.empty())
			{
				inQuotes = true;
				fieldStarted = true;
			}
			else if (c == delimiter)
			{
				record.push_back(field);
				field.clear();
				fieldStarted = true;
			}
			else if (c == '\r' || c == '\n')
			{
				if (c == '\r' && i + 1 < content.size() && content[i + 1] == '\n')
				{
					++i;
				}
				if (fieldStarted || !field.empty() || !record.empty())
				{
					record.push_back(field);
				}
				records.push_back(record);
				record.clear();
				field.clear();
				fieldStarted = false;
			}
			else
			{
				field += c;
			}
		}
		if (fieldStarted || !field.empty() || !record.empty())
		{
			record.push_back(field);
			records.push_back(record);
		}
		return records;
	}
}

// Reads a spreadsheet into a DataTable; the format is chosen by file extension
TableLoadResult BatchRenamerLogic::loadTable(const fs::path &spreadsheetPath)
{
	TableLoadResult results;

	std::error_code ec;
	if (!fs::exists(spreadsheetPath, ec) || ec)
	{
		results.errorKind = BatchErrorKind::NotFound;
		results.errorMessage = "File not found: " + spreadsheetPath.u8string();
		return results;
	}
	if (!fs::is_regular_file(spreadsheetPath, ec) || ec)
	{
		results.errorKind = BatchErrorKind::InvalidTarget;
		results.errorMessage = "Not a file: " + spreadsheetPath.u8string();
		return results;
	}

	const std::string ext = ToLower(spreadsheetPath.extension().string());
	if (ext != ".xlsx" && ext != ".csv")
	{
		results.errorKind = BatchErrorKind::UnsupportedFormat;
		results.errorMessage = (ext == ".xls")
								   ? "Legacy .xls workbooks are not supported. Save the file as .xlsx or .csv."
								   : "Unsupported spreadsheet type '" + ext + "'. Use .xlsx or .csv.";
		return results;
	}

	try
	{
		results = (ext == ".xlsx") ? loadWorkbook(spreadsheetPath) : loadDelimitedText(spreadsheetPath);
	}
	catch (const fs::filesystem_error &ex)
	{
		results = TableLoadResult();
		results.errorKind = BatchErrorKind::ParseFailure;
		results.errorMessage = "Filesystem Exception: " + std::string(ex.what());
		return results;
	}
	catch (const std::exception &ex)
	{
		results = TableLoadResult();
		results.errorKind = BatchErrorKind::ParseFailure;
		results.errorMessage = "Could not read " + spreadsheetPath.u8string() + ": " + std::string(ex.what());
		return results;
	}

	if (results.success)
	{
		wxLogVerbose("Loaded %d row(s) with columns [%s] from %s", (int)results.table.Rows.size(),
					 JoinList(results.table.Columns, ", ").c_str(), spreadsheetPath.string().c_str());
	}
	return results;
}

TableLoadResult BatchRenamerLogic::loadWorkbook(const fs::path &workbookPath)
{
	TableLoadResult results;
	std::map<std::string, std::string> parts;
	std::string error;
	if (!ReadPackageParts(workbookPath, parts, error))
	{
		results.errorKind = BatchErrorKind::ParseFailure;
		results.errorMessage = error;
		return results;
	}

	const std::string sheetPart = ResolveSheetPart(parts);
	auto sheetIt = parts.find(sheetPart);
	if (sheetIt == parts.end())
	{
		results.errorKind = BatchErrorKind::ParseFailure;
		results.errorMessage = "Workbook has no readable worksheet (" + sheetPart + ")";
		return results;
	}
	wxXmlDocument sheetDoc;
	if (!ParseXml(sheetIt->second, sheetDoc))
	{
		results.errorKind = BatchErrorKind::ParseFailure;
		results.errorMessage = "Worksheet XML is malformed: " + sheetPart;
		return results;
	}
	wxXmlNode *sheetData = FirstChildElement(sheetDoc.GetRoot(), "sheetData");
	if (!sheetData)
	{
		results.errorKind = BatchErrorKind::ParseFailure;
		results.errorMessage = "Worksheet has no data section: " + sheetPart;
		return results;
	}

	const std::vector<std::string> sharedStrings = LoadSharedStrings(parts);
	const DateStyles dates = LoadDateStyles(parts);

	// Rows are addressed by their 1-based "r" attribute; the grid starts at the first row present
	std::vector<std::vector<CellValue>> grid;
	long firstRowNumber = -1;
	long lastRowNumber = 0;
	for (wxXmlNode *row = sheetData->GetChildren(); row; row = row->GetNext())
	{
		if (row->GetType() != wxXML_ELEMENT_NODE || row->GetName() != "row")
		{
			continue;
		}
		long rowNumber = lastRowNumber + 1;
		long parsed = 0;
		if (row->GetAttribute("r").ToLong(&parsed) && parsed > 0)
		{
			rowNumber = parsed;
		}
		if (rowNumber < lastRowNumber || rowNumber > MaxRows)
		{
			results.errorKind = BatchErrorKind::ParseFailure;
			results.errorMessage = "Worksheet row " + std::to_string(rowNumber) + " is out of order or out of range: " + sheetPart;
			return results;
		}
		lastRowNumber = rowNumber;
		if (firstRowNumber < 0)
		{
			firstRowNumber = rowNumber;
		}
		const std::size_t gridIndex = static_cast<std::size_t>(rowNumber - firstRowNumber);
		if (grid.size() <= gridIndex)
		{
			grid.resize(gridIndex + 1);
		}

		std::vector<CellValue> &cells = grid[gridIndex];
		std::size_t nextColumn = 0;
		for (wxXmlNode *cell = row->GetChildren(); cell; cell = cell->GetNext())
		{
			if (cell->GetType() != wxXML_ELEMENT_NODE || cell->GetName() != "c")
			{
				continue;
			}
			std::size_t column = nextColumn;
			if (auto fromRef = ColumnFromReference(ToUtf8(cell->GetAttribute("r"))))
			{
				column = *fromRef;
			}
			if (column >= MaxColumns)
			{
				results.errorKind = BatchErrorKind::ParseFailure;
				results.errorMessage = "Worksheet row " + std::to_string(rowNumber) + " has a cell beyond column XFD: " + sheetPart;
				return results;
			}
			nextColumn = column + 1;
			if (cells.size() <= column)
			{
				cells.resize(column + 1);
			}
			cells[column] = ReadCell(cell, sharedStrings, dates);
		}
	}

	BuildTable(std::move(grid), results.table);
	if (results.table.Columns.empty())
	{
		results.errorKind = BatchErrorKind::ParseFailure;
		results.errorMessage = "Worksheet is empty: " + workbookPath.u8string();
		return results;
	}
	results.success = true;
	return results;
}

TableLoadResult BatchRenamerLogic::loadDelimitedText(const fs::path &csvPath)
{
	TableLoadResult results;
	std::ifstream in(csvPath, std::ios::binary);
	if (!in)
	{
		results.errorKind = BatchErrorKind::ParseFailure;
		results.errorMessage = "Cannot open file: " + csvPath.u8string();
		return results;
	}
	std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
	if (content.size() >= 3 && content.compare(0, 3, "\xEF\xBB\xBF") == 0)
	{
		content.erase(0, 3); // UTF-8 byte order mark
	}

	std::vector<std::vector<CellValue>> grid;
	bool header = true;
	for (const auto &record : SplitDelimited(content, ','))
	{
		std::vector<CellValue> row;
		for (const auto &field : record)
		{
			// Header cells are names, never numbers
			row.push_back(header ? CellValue::FromText(Trim(field)) : ParseScalar(field));
		}
		if (header && RowIsBlank(row))
		{
			continue; // Leading blank lines before the header
		}
		header = false;
		grid.push_back(std::move(row));
	}

	BuildTable(std::move(grid), results.table);
	if (results.table.Columns.empty())
	{
		results.errorKind = BatchErrorKind::ParseFailure;
		results.errorMessage = "File contains no header row: " + csvPath.u8string();
		return results;
	}
	results.success = true;
	return results;
}
