#include <wx/wxprec.h>

#ifndef WX_PRECOMP
#include <wx/wx.h>
#endif

#include <wx/panel.h>
#include <wx/stattext.h>
#include <wx/textctrl.h>
#include <wx/button.h>
#include <wx/gauge.h>
#include <wx/statusbr.h>
#include <wx/msgdlg.h>
#include <wx/menu.h> // For disabling menu items in SetUIBusy

#include "WizardFrame.h"

#include <string>

// Updates the text displayed in the status bar
void WizardFrame::UpdateStatusBar(const wxString &text)
{
	if (m_statusBar)
	{
		m_statusBar->SetStatusText(text);
	}
}

// Mirrors a message into the log pane; errors are shown in red
void WizardFrame::AppendLog(const wxString &text, bool isError)
{
	wxTextAttr redStyle(*wxRED);
	wxTextAttr normalStyle;
	logTextCtrl->SetDefaultStyle(isError ? redStyle : normalStyle);
	logTextCtrl->AppendText(text + "\n");
	logTextCtrl->SetDefaultStyle(normalStyle);
}

void WizardFrame::ShowError(const wxString &title, const wxString &message)
{
	wxLogError("%s: %s", title, message);
	AppendLog("Error: " + message, true);
	UpdateStatusBar("Error: " + title);
	wxMessageBox(message, title, wxOK | wxICON_ERROR, this);
}

// Re-reads the controller and redraws the page for the current stage
void WizardFrame::RefreshStage()
{
	const WizardStage stage = m_controller.Stage();
	titleText->SetLabel(WizardController::StageTitle(stage));
	contentText->SetLabel(WizardController::StageInstructions(stage));
	stageStatusText->SetLabel(wxString::FromUTF8(m_controller.StageStatus()));

	switch (stage)
	{
	case WizardStage::SelectFolder:
		actionButton->SetLabel(m_controller.Files().empty() ? "Select folder" : "Change folder");
		break;
	case WizardStage::SelectData:
		if (m_controller.Spreadsheet().empty())
			actionButton->SetLabel("Select file");
		else
			actionButton->SetLabel("Select columns");
		break;
	case WizardStage::BuildFormat:
		actionButton->SetLabel("Select output format");
		break;
	case WizardStage::Confirm:
		actionButton->SetLabel("Start renaming files");
		break;
	}

	changeFileButton->Show(stage == WizardStage::SelectData && !m_controller.Spreadsheet().empty());
	stageCounterText->SetLabel(wxString::Format("Stage %d of %d", (int)m_controller.StageIndex() + 1, (int)WizardController::StageCount()));
	prevButton->Enable(m_controller.CanGoBack());
	nextButton->Enable(m_controller.CanAdvance());
	mainPanel->Layout();
}

// Enables or disables UI elements while a blocking operation runs
void WizardFrame::SetUIBusy(bool busy)
{
	bool enable = !busy;

	actionButton->Enable(enable);
	changeFileButton->Enable(enable);
	prevButton->Enable(enable && m_controller.CanGoBack());
	nextButton->Enable(enable && m_controller.CanAdvance());

	wxMenuBar *menuBar = GetMenuBar();
	if (menuBar)
	{
		menuBar->Enable(wxID_EXIT, enable);
		menuBar->Enable(ID_AllowedExtensions, enable);
		menuBar->Enable(ID_PagesPerChunk, enable);
		menuBar->Enable(ID_HelpTopics, enable);
		menuBar->Enable(wxID_ABOUT, enable);
	}

	if (busy)
	{
		UpdateStatusBar("Processing...");
		progressBar->Pulse();
		wxBeginBusyCursor();
		wxYield(); // Let the busy state paint before the blocking call
	}
	else
	{
		// Status bar will be updated by the calling function with a more specific message
		progressBar->SetValue(0);
		wxEndBusyCursor();
	}
}
