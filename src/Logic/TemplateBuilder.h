#ifndef TEMPLATEBUILDER_H
#define TEMPLATEBUILDER_H

#include "BatchRenamerLogic.h"

#include <vector>
#include <string>
#include <set>
#include <cstddef>

// Unordered set of spreadsheet columns chosen for the file name
class FieldSelection
{
public:
	FieldSelection() = default;
	explicit FieldSelection(std::vector<std::string> availableFields);

	bool Toggle(const std::string &field);
	bool IsSelected(const std::string &field) const;
	std::vector<std::string> Selected() const;
	std::size_t SelectedCount() const { return m_selected.size(); }
	const std::vector<std::string> &Available() const { return m_available; }
	void Clear() { m_selected.clear(); }

	// Case-insensitive substring filter over the available fields
	std::vector<std::string> Filter(const std::string &searchTerm) const;

	static std::size_t PageCount(std::size_t itemCount, std::size_t itemsPerPage);
	static std::vector<std::string> Page(const std::vector<std::string> &items, std::size_t pageIndex, std::size_t itemsPerPage);

	static constexpr std::size_t DefaultItemsPerPage = 20;
	static constexpr std::size_t DefaultDisplayColumns = 3;

private:
	std::vector<std::string> m_available;
	std::set<std::string> m_selected;
};

// Ordered field markers with a separator slot after every marker but the last.
// Separator slots are positional: reordering markers leaves the slots in place.
class TemplateBuilder
{
public:
	TemplateBuilder() = default;
	TemplateBuilder(std::vector<std::string> fields, const std::string &extension);

	const std::vector<std::string> &Fields() const { return m_fields; }
	std::size_t FieldCount() const { return m_fields.size(); }
	std::size_t SeparatorCount() const { return m_separators.size(); }
	const std::string &Separator(std::size_t slot) const;
	bool SetSeparator(std::size_t slot, const std::string &text);
	const std::string &Extension() const { return m_extension; }

	static std::size_t SlotForDropPosition(int dropX, int cellWidth, std::size_t fieldCount);
	bool MoveField(std::size_t fromIndex, std::size_t toSlot);
	bool DropField(std::size_t fromIndex, int dropX, int cellWidth);

	NameTemplate Build() const;

	static constexpr int DefaultCellWidth = 120;

private:
	std::vector<std::string> m_fields;
	std::vector<std::string> m_separators;
	std::string m_extension;
};

#endif // TEMPLATEBUILDER_H
