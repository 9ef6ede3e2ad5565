#include "TestFixtures.h"
#include "../../src/Logic/BatchRenamerLogic.h"
#include <wx/wfstream.h>
#include <wx/zipstrm.h>
#include <map>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace
{
    const char *const WorkbookXml =
        "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>"
        "<workbook xmlns=\"http://schemas.openxmlformats.org/spreadsheetml/2006/main\" "
        "xmlns:r=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships\">"
        "<sheets><sheet name=\"Data\" sheetId=\"1\" r:id=\"rId1\"/></sheets></workbook>";

    const char *const WorkbookRelsXml =
        "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>"
        "<Relationships xmlns=\"http://schemas.openxmlformats.org/package/2006/relationships\">"
        "<Relationship Id=\"rId2\" Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/styles\" Target=\"styles.xml\"/>"
        "<Relationship Id=\"rId1\" Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/worksheet\" Target=\"worksheets/data.xml\"/>"
        "</Relationships>";

    const char *const SharedStringsXml =
        "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>"
        "<sst xmlns=\"http://schemas.openxmlformats.org/spreadsheetml/2006/main\" count=\"4\" uniqueCount=\"4\">"
        "<si><t>Name</t></si>"
        "<si><t>Year</t></si>"
        "<si><t>Alpha</t></si>"
        "<si><r><t>Be</t></r><r><t>ta</t></r></si>"
        "</sst>";

    const char *const DataSheetXml =
        "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>"
        "<worksheet xmlns=\"http://schemas.openxmlformats.org/spreadsheetml/2006/main\"><sheetData>"
        "<row r=\"1\"><c r=\"A1\" t=\"s\"><v>0</v></c><c r=\"B1\" t=\"s\"><v>1</v></c>"
        "<c r=\"C1\" t=\"inlineStr\"><is><t>Approved</t></is></c></row>"
        "<row r=\"2\"><c r=\"A2\" t=\"s\"><v>2</v></c><c r=\"B2\"><v>2020</v></c><c r=\"C2\" t=\"b\"><v>1</v></c></row>"
        "<row r=\"3\"><c r=\"A3\" t=\"s\"><v>3</v></c><c r=\"B3\"><v>2021.5</v></c></row>"
        "</sheetData></worksheet>";

    void WriteWorkbook(const fs::path &path, const std::map<std::string, std::string> &parts)
    {
        wxFFileOutputStream file(wxString(path.wstring()));
        ASSERT_TRUE(file.IsOk()) << "Cannot create " << path.string();
        wxZipOutputStream zip(file);
        for (const auto &part : parts)
        {
            zip.PutNextEntry(wxString::FromUTF8(part.first));
            zip.Write(part.second.data(), part.second.size());
        }
        ASSERT_TRUE(zip.Close());
    }
}

TEST_F(BatchRenamerFilesystemTest, LoadTable_Workbook)
{
    fs::path workbook = tempTestDir / "data.xlsx";
    WriteWorkbook(workbook, {{"xl/workbook.xml", WorkbookXml},
                             {"xl/_rels/workbook.xml.rels", WorkbookRelsXml},
                             {"xl/sharedStrings.xml", SharedStringsXml},
                             {"xl/worksheets/data.xml", DataSheetXml}});

    TableLoadResult results = BatchRenamerLogic::loadTable(workbook);

    ASSERT_TRUE(results.success) << results.errorMessage;
    std::vector<std::string> expectedColumns = {"Name", "Year", "Approved"};
    EXPECT_EQ(results.table.Columns, expectedColumns);
    ASSERT_EQ(results.table.Rows.size(), 2u);

    EXPECT_EQ(results.table.Cell(0, 0).Text, "Alpha");
    EXPECT_EQ(results.table.Cell(1, 0).Text, "Beta");
    EXPECT_EQ(results.table.Cell(0, 1).Kind, CellKind::Integer);
    EXPECT_EQ(results.table.Cell(0, 1).Integer, 2020);
    EXPECT_EQ(results.table.Cell(1, 1).Kind, CellKind::Real);
    EXPECT_DOUBLE_EQ(results.table.Cell(1, 1).Real, 2021.5);
    EXPECT_EQ(results.table.Cell(0, 2).Kind, CellKind::Boolean);
    EXPECT_TRUE(results.table.Cell(0, 2).Boolean);
    EXPECT_EQ(results.table.Cell(1, 2).Kind, CellKind::Empty);
}

TEST_F(BatchRenamerFilesystemTest, LoadTable_WorkbookWithoutRelationshipsUsesFirstSheet)
{
    const std::string sheet =
        "<worksheet><sheetData>"
        "<row r=\"1\"><c r=\"A1\" t=\"inlineStr\"><is><t>Name</t></is></c>"
        "<c r=\"C1\" t=\"inlineStr\"><is><t>Code</t></is></c></row>"
        "<row r=\"2\"><c r=\"A2\" t=\"inlineStr\"><is><t>Alpha</t></is></c><c r=\"B2\"><v>7</v></c>"
        "<c r=\"C2\" t=\"str\"><v>X1</v></c></row>"
        "</sheetData></worksheet>";
    fs::path workbook = tempTestDir / "sparse.xlsx";
    WriteWorkbook(workbook, {{"xl/worksheets/sheet1.xml", sheet}});

    TableLoadResult results = BatchRenamerLogic::loadTable(workbook);

    ASSERT_TRUE(results.success) << results.errorMessage;
    std::vector<std::string> expectedColumns = {"Name", "Unnamed: 1", "Code"};
    EXPECT_EQ(results.table.Columns, expectedColumns);
    ASSERT_EQ(results.table.Rows.size(), 1u);
    EXPECT_EQ(results.table.Cell(0, 1).Integer, 7);
    EXPECT_EQ(results.table.Cell(0, 2).Text, "X1");
}

TEST_F(BatchRenamerFilesystemTest, LoadTable_DelimitedText)
{
    fs::path csv = tempTestDir / "data.csv";
    CreateDummyFile(csv, "Name,Year,Note\r\n"
                         "Alpha,2020,\"Hello, world\"\r\n"
                         "Beta,2020.0,\"say \"\"hi\"\"\"\r\n");

    TableLoadResult results = BatchRenamerLogic::loadTable(csv);

    ASSERT_TRUE(results.success) << results.errorMessage;
    std::vector<std::string> expectedColumns = {"Name", "Year", "Note"};
    EXPECT_EQ(results.table.Columns, expectedColumns);
    ASSERT_EQ(results.table.Rows.size(), 2u);
    EXPECT_EQ(results.table.Cell(0, 1).Kind, CellKind::Integer);
    EXPECT_EQ(results.table.Cell(0, 2).Text, "Hello, world");
    EXPECT_EQ(results.table.Cell(1, 1).Kind, CellKind::Real);
    EXPECT_EQ(BatchRenamerLogic::FormatCellValue(results.table.Cell(1, 1)), "2020");
    EXPECT_EQ(results.table.Cell(1, 2).Text, "say \"hi\"");
}

TEST_F(BatchRenamerFilesystemTest, LoadTable_ShortRowsArePadded)
{
    fs::path csv = tempTestDir / "short.csv";
    CreateDummyFile(csv, "\xEF\xBB\xBFName,Year\nAlpha\n\n");

    TableLoadResult results = BatchRenamerLogic::loadTable(csv);

    ASSERT_TRUE(results.success) << results.errorMessage;
    EXPECT_EQ(results.table.Columns.front(), "Name");
    ASSERT_EQ(results.table.Rows.size(), 1u);
    ASSERT_EQ(results.table.Rows[0].size(), 2u);
    EXPECT_EQ(results.table.Cell(0, 1).Kind, CellKind::Empty);
}

TEST_F(BatchRenamerFilesystemTest, LoadTable_LegacyWorkbookRejected)
{
    fs::path xls = tempTestDir / "old.xls";
    CreateDummyFile(xls, "not really a workbook");

    TableLoadResult results = BatchRenamerLogic::loadTable(xls);

    EXPECT_FALSE(results.success);
    EXPECT_EQ(results.errorKind, BatchErrorKind::UnsupportedFormat);
}

TEST_F(BatchRenamerFilesystemTest, LoadTable_UnknownExtensionRejected)
{
    fs::path ods = tempTestDir / "data.ods";
    CreateDummyFile(ods, "x");

    TableLoadResult results = BatchRenamerLogic::loadTable(ods);

    EXPECT_FALSE(results.success);
    EXPECT_EQ(results.errorKind, BatchErrorKind::UnsupportedFormat);
}

TEST_F(BatchRenamerFilesystemTest, LoadTable_NotFound)
{
    TableLoadResult results = BatchRenamerLogic::loadTable(tempTestDir / "missing.xlsx");

    EXPECT_FALSE(results.success);
    EXPECT_EQ(results.errorKind, BatchErrorKind::NotFound);
}

TEST_F(BatchRenamerFilesystemTest, LoadTable_CorruptWorkbook)
{
    fs::path workbook = tempTestDir / "broken.xlsx";
    CreateDummyFile(workbook, "this is plain text, not a zip archive");

    TableLoadResult results = BatchRenamerLogic::loadTable(workbook);

    EXPECT_FALSE(results.success);
    EXPECT_EQ(results.errorKind, BatchErrorKind::ParseFailure);
}

TEST_F(BatchRenamerFilesystemTest, LoadTable_WorkbookRowsOutOfOrder)
{
    const std::string sheet =
        "<worksheet><sheetData>"
        "<row r=\"5\"><c r=\"A5\" t=\"inlineStr\"><is><t>Name</t></is></c></row>"
        "<row r=\"2\"><c r=\"A2\" t=\"inlineStr\"><is><t>Alpha</t></is></c></row>"
        "</sheetData></worksheet>";
    fs::path workbook = tempTestDir / "shuffled.xlsx";
    WriteWorkbook(workbook, {{"xl/worksheets/sheet1.xml", sheet}});

    TableLoadResult results = BatchRenamerLogic::loadTable(workbook);

    EXPECT_FALSE(results.success);
    EXPECT_EQ(results.errorKind, BatchErrorKind::ParseFailure);
    EXPECT_NE(results.errorMessage.find("row 2"), std::string::npos);
}

TEST_F(BatchRenamerFilesystemTest, LoadTable_WorkbookCellBeyondLastColumn)
{
    const std::string sheet =
        "<worksheet><sheetData>"
        "<row r=\"1\"><c r=\"A1\" t=\"inlineStr\"><is><t>Name</t></is></c>"
        "<c r=\"ZZZZZZZZZZ1\" t=\"inlineStr\"><is><t>Far</t></is></c></row>"
        "</sheetData></worksheet>";
    fs::path workbook = tempTestDir / "wide.xlsx";
    WriteWorkbook(workbook, {{"xl/worksheets/sheet1.xml", sheet}});

    TableLoadResult results = BatchRenamerLogic::loadTable(workbook);

    EXPECT_FALSE(results.success);
    EXPECT_EQ(results.errorKind, BatchErrorKind::ParseFailure);
    EXPECT_NE(results.errorMessage.find("XFD"), std::string::npos);
}

TEST_F(BatchRenamerFilesystemTest, LoadTable_WorkbookDateCells)
{
    // Style 1 uses built-in format 14 (m/d/yyyy), style 2 a custom date-time format,
    // style 3 a plain number format
    const std::string styles =
        "<styleSheet><numFmts count=\"2\">"
        "<numFmt numFmtId=\"164\" formatCode=\"yyyy\\-mm\\-dd\\ hh:mm\"/>"
        "<numFmt numFmtId=\"165\" formatCode=\"&quot;Day &quot;0.00\"/>"
        "</numFmts><cellXfs count=\"4\">"
        "<xf numFmtId=\"0\"/><xf numFmtId=\"14\"/><xf numFmtId=\"164\"/><xf numFmtId=\"165\"/>"
        "</cellXfs></styleSheet>";
    const std::string sheet =
        "<worksheet><sheetData>"
        "<row r=\"1\"><c r=\"A1\" t=\"inlineStr\"><is><t>Issued</t></is></c>"
        "<c r=\"B1\" t=\"inlineStr\"><is><t>Stamp</t></is></c>"
        "<c r=\"C1\" t=\"inlineStr\"><is><t>Count</t></is></c></row>"
        "<row r=\"2\"><c r=\"A2\" s=\"1\"><v>43831</v></c><c r=\"B2\" s=\"2\"><v>43831.75</v></c>"
        "<c r=\"C2\" s=\"3\"><v>43831</v></c></row>"
        "</sheetData></worksheet>";
    fs::path workbook = tempTestDir / "dates.xlsx";
    WriteWorkbook(workbook, {{"xl/worksheets/sheet1.xml", sheet}, {"xl/styles.xml", styles}});

    TableLoadResult results = BatchRenamerLogic::loadTable(workbook);

    ASSERT_TRUE(results.success) << results.errorMessage;
    ASSERT_EQ(results.table.Rows.size(), 1u);
    EXPECT_EQ(results.table.Cell(0, 0).Kind, CellKind::Text);
    EXPECT_EQ(results.table.Cell(0, 0).Text, "2020-01-01 00:00:00");
    EXPECT_EQ(results.table.Cell(0, 1).Text, "2020-01-01 18:00:00");
    EXPECT_EQ(results.table.Cell(0, 2).Kind, CellKind::Integer);
    EXPECT_EQ(results.table.Cell(0, 2).Integer, 43831);
}

TEST_F(BatchRenamerFilesystemTest, LoadTable_Workbook1904DateSystem)
{
    const std::string workbookXml =
        "<workbook><workbookPr date1904=\"1\"/><sheets><sheet name=\"Data\" sheetId=\"1\" r:id=\"rId1\" "
        "xmlns:r=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships\"/></sheets></workbook>";
    const std::string styles = "<styleSheet><cellXfs count=\"2\"><xf numFmtId=\"0\"/><xf numFmtId=\"14\"/></cellXfs></styleSheet>";
    const std::string sheet =
        "<worksheet><sheetData>"
        "<row r=\"1\"><c r=\"A1\" t=\"inlineStr\"><is><t>Issued</t></is></c></row>"
        "<row r=\"2\"><c r=\"A2\" s=\"1\"><v>42369</v></c></row>"
        "</sheetData></worksheet>";
    fs::path workbook = tempTestDir / "mac.xlsx";
    WriteWorkbook(workbook, {{"xl/workbook.xml", workbookXml},
                             {"xl/_rels/workbook.xml.rels", WorkbookRelsXml},
                             {"xl/worksheets/data.xml", sheet},
                             {"xl/styles.xml", styles}});

    TableLoadResult results = BatchRenamerLogic::loadTable(workbook);

    ASSERT_TRUE(results.success) << results.errorMessage;
    EXPECT_EQ(results.table.Cell(0, 0).Text, "2020-01-01 00:00:00");
}

TEST_F(BatchRenamerFilesystemTest, LoadTable_EmptyDelimitedText)
{
    fs::path csv = tempTestDir / "empty.csv";
    CreateDummyFile(csv, "");

    TableLoadResult results = BatchRenamerLogic::loadTable(csv);

    EXPECT_FALSE(results.success);
    EXPECT_EQ(results.errorKind, BatchErrorKind::ParseFailure);
}
