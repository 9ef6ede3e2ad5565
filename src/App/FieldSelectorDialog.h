#ifndef FIELDSELECTORDIALOG_H
#define FIELDSELECTORDIALOG_H

#include <wx/wxprec.h>
#ifndef WX_PRECOMP
#include <wx/wx.h>
#endif

#include <wx/dialog.h>

#include "TemplateBuilder.h"

#include <vector>
#include <string>

class wxTextCtrl;
class wxButton;
class wxCheckBox;
class wxStaticText;

// Paged checkbox list of spreadsheet columns with a search filter.
// Works on a copy of the selection; read it back with GetSelection() after wxID_OK.
class FieldSelectorDialog : public wxDialog
{
public:
	FieldSelectorDialog(wxWindow *parent, const FieldSelection &selection);

	const FieldSelection &GetSelection() const { return m_selection; }

private:
	FieldSelection m_selection;
	std::vector<std::string> m_filtered;
	std::size_t m_page;

	wxTextCtrl *searchCtrl;
	std::vector<wxCheckBox *> m_checkBoxes;
	wxButton *prevPageButton;
	wxStaticText *pageLabel;
	wxButton *nextPageButton;
	wxStaticText *countLabel;

	void RebuildPage();
	void UpdateCount();
	void OnToggle(std::size_t slot);
	void OnSearch(wxCommandEvent &event);
	void OnPrevPage(wxCommandEvent &event);
	void OnNextPage(wxCommandEvent &event);
};

#endif // FIELDSELECTORDIALOG_H
