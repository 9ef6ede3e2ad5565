#include "HelpDialog.h"
#include <wx/sizer.h>
#include <wx/textctrl.h>
#include <wx/button.h>

HelpDialog::HelpDialog(wxWindow *parent,
					   wxWindowID id,
					   const wxString &title,
					   const wxString &helpContent,
					   const wxString &initialTopic,
					   const wxPoint &pos,
					   const wxSize &size,
					   long style)
	: wxDialog(parent, id, title, pos, size, style)
{
	wxBoxSizer *mainSizer = new wxBoxSizer(wxVERTICAL);

	helpTextCtrl = new wxTextCtrl(
		this,
		wxID_ANY,
		helpContent,
		wxDefaultPosition,
		wxDefaultSize,
		wxTE_MULTILINE | wxTE_READONLY | wxTE_RICH2);
	mainSizer->Add(helpTextCtrl, 1, wxEXPAND | wxALL, 10);

	wxStdDialogButtonSizer *buttonSizer = new wxStdDialogButtonSizer();
	okButton = new wxButton(this, wxID_OK);
	buttonSizer->AddButton(okButton);
	buttonSizer->Realize();
	mainSizer->Add(buttonSizer, 0, wxALIGN_CENTER_HORIZONTAL | wxBOTTOM, 10);

	SetSizer(mainSizer);
	mainSizer->SetSizeHints(this);
	SetInitialSize(size);
	Centre(wxBOTH);

	if (!initialTopic.IsEmpty())
	{
		ScrollToTopic(initialTopic);
	}

	Bind(wxEVT_BUTTON, &HelpDialog::OnOk, this, wxID_OK);
}

// Highlights the first occurrence of the topic heading and brings it into view
void HelpDialog::ScrollToTopic(const wxString &topic)
{
	int found = helpTextCtrl->GetValue().Find(topic);
	if (found == wxNOT_FOUND)
	{
		helpTextCtrl->ShowPosition(0);
		return;
	}
	helpTextCtrl->SetSelection(found, found + (long)topic.length());
	helpTextCtrl->ShowPosition(found);
}

void HelpDialog::OnOk(wxCommandEvent &WXUNUSED(event))
{
	EndModal(wxID_OK);
}
