#include "FieldSelectorDialog.h"
#include <wx/sizer.h>
#include <wx/textctrl.h>
#include <wx/button.h>
#include <wx/checkbox.h>
#include <wx/stattext.h>

FieldSelectorDialog::FieldSelectorDialog(wxWindow *parent, const FieldSelection &selection)
	: wxDialog(parent, wxID_ANY, "Select Columns", wxDefaultPosition, wxDefaultSize, wxDEFAULT_DIALOG_STYLE | wxRESIZE_BORDER),
	  m_selection(selection),
	  m_filtered(selection.Available()),
	  m_page(0)
{
	wxBoxSizer *mainSizer = new wxBoxSizer(wxVERTICAL);

	wxBoxSizer *searchSizer = new wxBoxSizer(wxHORIZONTAL);
	searchSizer->Add(new wxStaticText(this, wxID_ANY, "Search:"), 0, wxALIGN_CENTER_VERTICAL | wxRIGHT, 5);
	searchCtrl = new wxTextCtrl(this, wxID_ANY, "");
	searchSizer->Add(searchCtrl, 1, wxEXPAND);
	mainSizer->Add(searchSizer, 0, wxEXPAND | wxALL, 10);

	// One fixed grid of checkboxes, relabelled per page
	wxGridSizer *checkGrid = new wxGridSizer(0, (int)FieldSelection::DefaultDisplayColumns, 5, 15);
	for (std::size_t i = 0; i < FieldSelection::DefaultItemsPerPage; ++i)
	{
		wxCheckBox *checkBox = new wxCheckBox(this, wxID_ANY, "");
		checkBox->Bind(wxEVT_CHECKBOX, [this, i](wxCommandEvent &)
					   { OnToggle(i); });
		checkGrid->Add(checkBox, 0, wxEXPAND);
		m_checkBoxes.push_back(checkBox);
	}
	mainSizer->Add(checkGrid, 1, wxEXPAND | wxLEFT | wxRIGHT, 10);

	wxBoxSizer *pagerSizer = new wxBoxSizer(wxHORIZONTAL);
	prevPageButton = new wxButton(this, wxID_ANY, "Previous");
	pageLabel = new wxStaticText(this, wxID_ANY, "");
	nextPageButton = new wxButton(this, wxID_ANY, "Next");
	pagerSizer->Add(prevPageButton, 0, wxALL, 5);
	pagerSizer->AddStretchSpacer(1);
	pagerSizer->Add(pageLabel, 0, wxALIGN_CENTER_VERTICAL | wxALL, 5);
	pagerSizer->AddStretchSpacer(1);
	pagerSizer->Add(nextPageButton, 0, wxALL, 5);
	mainSizer->Add(pagerSizer, 0, wxEXPAND | wxLEFT | wxRIGHT | wxTOP, 10);

	countLabel = new wxStaticText(this, wxID_ANY, "");
	mainSizer->Add(countLabel, 0, wxLEFT | wxRIGHT | wxTOP, 15);

	wxStdDialogButtonSizer *buttonSizer = new wxStdDialogButtonSizer();
	buttonSizer->AddButton(new wxButton(this, wxID_OK, "Confirm"));
	buttonSizer->AddButton(new wxButton(this, wxID_CANCEL));
	buttonSizer->Realize();
	mainSizer->Add(buttonSizer, 0, wxALIGN_CENTER_HORIZONTAL | wxALL, 10);

	SetSizer(mainSizer);
	RebuildPage();
	mainSizer->SetSizeHints(this);
	SetInitialSize(wxSize(620, -1));
	Centre(wxBOTH);

	searchCtrl->Bind(wxEVT_TEXT, &FieldSelectorDialog::OnSearch, this);
	prevPageButton->Bind(wxEVT_BUTTON, &FieldSelectorDialog::OnPrevPage, this);
	nextPageButton->Bind(wxEVT_BUTTON, &FieldSelectorDialog::OnNextPage, this);
}

void FieldSelectorDialog::RebuildPage()
{
	const std::size_t perPage = FieldSelection::DefaultItemsPerPage;
	const std::size_t pageCount = FieldSelection::PageCount(m_filtered.size(), perPage);
	if (m_page >= pageCount)
		m_page = pageCount - 1;

	std::vector<std::string> pageItems = FieldSelection::Page(m_filtered, m_page, perPage);
	for (std::size_t i = 0; i < m_checkBoxes.size(); ++i)
	{
		if (i < pageItems.size())
		{
			m_checkBoxes[i]->SetLabel(wxString::FromUTF8(pageItems[i]));
			m_checkBoxes[i]->SetValue(m_selection.IsSelected(pageItems[i]));
			m_checkBoxes[i]->Show();
		}
		else
		{
			m_checkBoxes[i]->Hide();
		}
	}

	pageLabel->SetLabel(wxString::Format("Page %d of %d", (int)m_page + 1, (int)pageCount));
	prevPageButton->Enable(m_page > 0);
	nextPageButton->Enable(m_page + 1 < pageCount);
	UpdateCount();
	Layout();
}

void FieldSelectorDialog::UpdateCount()
{
	countLabel->SetLabel(wxString::Format("%d of %d column(s) selected", (int)m_selection.SelectedCount(), (int)m_selection.Available().size()));
}

void FieldSelectorDialog::OnToggle(std::size_t slot)
{
	const std::size_t index = m_page * FieldSelection::DefaultItemsPerPage + slot;
	if (index < m_filtered.size())
	{
		m_selection.Toggle(m_filtered[index]);
	}
	UpdateCount();
}

void FieldSelectorDialog::OnSearch(wxCommandEvent &WXUNUSED(event))
{
	m_filtered = m_selection.Filter(std::string(searchCtrl->GetValue().utf8_str()));
	m_page = 0;
	RebuildPage();
}

void FieldSelectorDialog::OnPrevPage(wxCommandEvent &WXUNUSED(event))
{
	if (m_page > 0)
	{
		--m_page;
		RebuildPage();
	}
}

void FieldSelectorDialog::OnNextPage(wxCommandEvent &WXUNUSED(event))
{
	++m_page;
	RebuildPage();
}
