#include "TemplateBuilder.h"

#include <wx/log.h>

#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

FieldSelection::FieldSelection(std::vector<std::string> availableFields)
	: m_available(std::move(availableFields))
{
}

// Flips a field in or out of the selection; unknown fields are refused
bool FieldSelection::Toggle(const std::string &field)
{
	if (std::find(m_available.begin(), m_available.end(), field) == m_available.end())
	{
		return false;
	}
	if (!m_selected.erase(field))
	{
		m_selected.insert(field);
	}
	return true;
}

bool FieldSelection::IsSelected(const std::string &field) const
{
	return m_selected.count(field) > 0;
}

// Selected fields, reported in column order
std::vector<std::string> FieldSelection::Selected() const
{
	std::vector<std::string> selected;
	for (const auto &field : m_available)
	{
		if (m_selected.count(field))
		{
			selected.push_back(field);
		}
	}
	return selected;
}

std::vector<std::string> FieldSelection::Filter(const std::string &searchTerm) const
{
	const std::string needle = ToLower(BatchRenamerLogic::Trim(searchTerm));
	if (needle.empty())
	{
		return m_available;
	}
	std::vector<std::string> matches;
	for (const auto &field : m_available)
	{
		if (ToLower(field).find(needle) != std::string::npos)
		{
			matches.push_back(field);
		}
	}
	return matches;
}

// Always at least one page, so an empty filter result still has a page to show
std::size_t FieldSelection::PageCount(std::size_t itemCount, std::size_t itemsPerPage)
{
	if (itemsPerPage == 0 || itemCount == 0)
	{
		return 1;
	}
	return (itemCount + itemsPerPage - 1) / itemsPerPage;
}

std::vector<std::string> FieldSelection::Page(const std::vector<std::string> &items, std::size_t pageIndex, std::size_t itemsPerPage)
{
	if (itemsPerPage == 0)
	{
		return items;
	}
	const std::size_t begin = pageIndex * itemsPerPage;
	if (begin >= items.size())
	{
		return {};
	}
	const std::size_t end = std::min(items.size(), begin + itemsPerPage);
	return std::vector<std::string>(items.begin() + begin, items.begin() + end);
}

TemplateBuilder::TemplateBuilder(std::vector<std::string> fields, const std::string &extension)
	: m_fields(std::move(fields)),
	  m_separators(m_fields.empty() ? 0 : m_fields.size() - 1),
	  m_extension(BatchRenamerLogic::NormaliseExtension(extension))
{
}

const std::string &TemplateBuilder::Separator(std::size_t slot) const
{
	static const std::string none;
	return slot < m_separators.size() ? m_separators[slot] : none;
}

// Key-time validation: text with characters outside the allowed set is refused
bool TemplateBuilder::SetSeparator(std::size_t slot, const std::string &text)
{
	if (slot >= m_separators.size() || !BatchRenamerLogic::IsAllowedSeparatorText(text))
	{
		return false;
	}
	m_separators[slot] = text;
	return true;
}

// Maps a horizontal drop coordinate to a marker slot. Markers sit every two cells
// (marker, separator entry), so the slot is the nearest multiple of 2 * cellWidth,
// clamped to [0, fieldCount - 1]
std::size_t TemplateBuilder::SlotForDropPosition(int dropX, int cellWidth, std::size_t fieldCount)
{
	if (fieldCount == 0 || cellWidth <= 0)
	{
		return 0;
	}
	const long slot = std::lround(static_cast<double>(dropX) / (2.0 * cellWidth));
	if (slot < 0)
	{
		return 0;
	}
	return std::min(static_cast<std::size_t>(slot), fieldCount - 1);
}

bool TemplateBuilder::MoveField(std::size_t fromIndex, std::size_t toSlot)
{
	if (fromIndex >= m_fields.size())
	{
		return false;
	}
	toSlot = std::min(toSlot, m_fields.size() - 1);
	std::string field = m_fields[fromIndex];
	m_fields.erase(m_fields.begin() + fromIndex);
	m_fields.insert(m_fields.begin() + toSlot, field);
	wxLogVerbose("Moved field '%s' from position %d to %d", field.c_str(), (int)fromIndex, (int)toSlot);
	return true;
}

bool TemplateBuilder::DropField(std::size_t fromIndex, int dropX, int cellWidth)
{
	return MoveField(fromIndex, SlotForDropPosition(dropX, cellWidth, m_fields.size()));
}

// Field, separator, field, separator, ... field; empty separators are omitted
NameTemplate TemplateBuilder::Build() const
{
	NameTemplate nameTemplate;
	nameTemplate.Extension = m_extension;
	for (std::size_t i = 0; i < m_fields.size(); ++i)
	{
		nameTemplate.Tokens.push_back({TokenKind::Field, m_fields[i]});
		if (i < m_separators.size() && !m_separators[i].empty())
		{
			nameTemplate.Tokens.push_back({TokenKind::Literal, m_separators[i]});
		}
	}
	return nameTemplate;
}
