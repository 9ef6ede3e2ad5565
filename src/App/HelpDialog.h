#ifndef HELPDIALOG_H
#define HELPDIALOG_H

#include <wx/wxprec.h>
#ifndef WX_PRECOMP
#include <wx/wx.h>
#endif

#include <wx/dialog.h>

class wxTextCtrl;
class wxButton;

// Read-only help text, opened scrolled to the heading of the topic the user is on
class HelpDialog : public wxDialog
{
public:
	HelpDialog(wxWindow *parent,
			   wxWindowID id,
			   const wxString &title,
			   const wxString &helpContent,
			   const wxString &initialTopic = wxEmptyString,
			   const wxPoint &pos = wxDefaultPosition,
			   const wxSize &size = wxSize(650, 450),
			   long style = wxDEFAULT_DIALOG_STYLE | wxRESIZE_BORDER);

private:
	wxTextCtrl *helpTextCtrl;
	wxButton *okButton;

	void ScrollToTopic(const wxString &topic);
	void OnOk(wxCommandEvent &event);
};

#endif // HELPDIALOG_H
