#include "BatchRenamerLogic.h"

#include <wx/log.h>

#include <algorithm>
#include <string>
#include <vector>

// Checks every literal separator of a template against the allowed character set
ValidationResult BatchRenamerLogic::validateTemplate(const NameTemplate &nameTemplate)
{
	ValidationResult results;

	if (nameTemplate.IsEmpty())
	{
		results.errorKind = BatchErrorKind::InvalidState;
		results.errorMessage = "The filename format is empty.";
		return results;
	}

	for (const auto &token : nameTemplate.Tokens)
	{
		if (token.Kind != TokenKind::Literal)
		{
			continue;
		}
		for (char c : token.Text)
		{
			if (!IsAllowedSeparatorChar(c) && results.invalidCharacters.find(c) == std::string::npos)
			{
				results.invalidCharacters.push_back(c);
			}
		}
	}

	if (!results.invalidCharacters.empty())
	{
		results.errorKind = BatchErrorKind::InvalidCharacters;
		results.errorMessage = "The filename format contains invalid characters: '" + results.invalidCharacters +
							   "'. Allowed: letters, digits and \"" + AllowedSeparatorPunctuation + "\".";
		return results;
	}

	results.success = true;
	return results;
}

// Expands the template once per table row. Field tokens take the row's formatted value,
// literal tokens are copied; the extension is left for the rename step
GenerationResult BatchRenamerLogic::generateNames(const DataTable &table, const std::vector<std::string> &selectedFields, const NameTemplate &nameTemplate)
{
	GenerationResult results;

	// Collect every column the generation depends on, reporting all absentees together
	std::vector<std::string> required = selectedFields;
	for (const auto &field : nameTemplate.FieldNames())
	{
		if (std::find(required.begin(), required.end(), field) == required.end())
		{
			required.push_back(field);
		}
	}
	for (const auto &field : required)
	{
		if (!table.HasColumn(field))
		{
			results.missingColumns.push_back(field);
		}
	}
	if (!results.missingColumns.empty())
	{
		results.errorKind = BatchErrorKind::MissingColumn;
		results.errorMessage = "The following columns were not found in the spreadsheet: " + JoinList(results.missingColumns, ", ");
		return results;
	}

	ValidationResult validation = validateTemplate(nameTemplate);
	if (!validation.success)
	{
		results.errorKind = validation.errorKind;
		results.errorMessage = validation.errorMessage;
		return results;
	}

	// Resolve token columns once rather than per row
	std::vector<std::size_t> tokenColumns(nameTemplate.Tokens.size(), 0);
	for (std::size_t i = 0; i < nameTemplate.Tokens.size(); ++i)
	{
		if (nameTemplate.Tokens[i].Kind == TokenKind::Field)
		{
			tokenColumns[i] = *table.ColumnIndex(nameTemplate.Tokens[i].Text);
		}
	}

	results.names.reserve(table.Rows.size());
	for (std::size_t row = 0; row < table.Rows.size(); ++row)
	{
		std::string name;
		for (std::size_t i = 0; i < nameTemplate.Tokens.size(); ++i)
		{
			const TemplateToken &token = nameTemplate.Tokens[i];
			if (token.Kind == TokenKind::Literal)
			{
				name += token.Text;
			}
			else
			{
				name += SanitiseNameComponent(FormatCellValue(table.Cell(row, tokenColumns[i])));
			}
		}
		results.names.push_back(name);
	}

	results.success = true;
	wxLogVerbose("Generated %d name(s) from format '%s'", (int)results.names.size(), nameTemplate.ToString().c_str());
	return results;
}
