#include "BatchRenamerLogic.h"

#include <algorithm>
#include <stdexcept>

// Only a single document type is accepted unless the user configures otherwise
const std::vector<std::string> BatchRenamerLogic::DefaultAllowedExtensions = {".pdf"};

// Extension of the only file type the chunk splitter understands
const std::string BatchRenamerLogic::SplittableExtension = ".pdf";

// Non-alphanumeric characters permitted in separator text
const std::string BatchRenamerLogic::AllowedSeparatorPunctuation = "-_,; ";

CellValue CellValue::FromText(const std::string &text)
{
	CellValue value;
	value.Kind = CellKind::Text;
	value.Text = text;
	return value;
}

CellValue CellValue::FromInteger(long long integer)
{
	CellValue value;
	value.Kind = CellKind::Integer;
	value.Integer = integer;
	return value;
}

CellValue CellValue::FromReal(double real)
{
	CellValue value;
	value.Kind = CellKind::Real;
	value.Real = real;
	return value;
}

CellValue CellValue::FromBoolean(bool boolean)
{
	CellValue value;
	value.Kind = CellKind::Boolean;
	value.Boolean = boolean;
	return value;
}

std::optional<std::size_t> DataTable::ColumnIndex(const std::string &name) const
{
	auto it = std::find(Columns.begin(), Columns.end(), name);
	if (it == Columns.end())
	{
		return std::nullopt;
	}
	return static_cast<std::size_t>(it - Columns.begin());
}

bool DataTable::HasColumn(const std::string &name) const
{
	return ColumnIndex(name).has_value();
}

const CellValue &DataTable::Cell(std::size_t row, std::size_t column) const
{
	if (row >= Rows.size() || column >= Rows[row].size())
	{
		throw std::out_of_range("DataTable::Cell index out of range");
	}
	return Rows[row][column];
}

// Textual form used for display and the "template exists" check
std::string NameTemplate::ToString() const
{
	std::string text;
	for (const auto &token : Tokens)
	{
		text += token.Text;
	}
	if (!Tokens.empty())
	{
		text += Extension;
	}
	return text;
}

std::vector<std::string> NameTemplate::FieldNames() const
{
	std::vector<std::string> names;
	for (const auto &token : Tokens)
	{
		if (token.Kind == TokenKind::Field)
		{
			names.push_back(token.Text);
		}
	}
	return names;
}
