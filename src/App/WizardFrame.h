#ifndef WIZARDFRAME_H
#define WIZARDFRAME_H

#include <wx/wx.h>
#include <wx/statusbr.h>
#include <wx/settings.h>
#include <wx/dnd.h>
#include <wx/gauge.h>

#include "WizardController.h"
#include "PdfChunkSplitter.h"
#include <filesystem>
#include <vector>

// Forward declarations
class wxPanel;
class wxButton;
class wxTextCtrl;
class wxStaticText;
class wxCloseEvent;
class PathDropTarget;

namespace fs = std::filesystem;

// Control IDs Enum
enum ControlIDs
{
	ID_ActionButton = wxID_HIGHEST + 1,
	ID_ChangeFileButton,
	ID_PrevButton,
	ID_NextButton,
	ID_HelpTopics,
	ID_AllowedExtensions,
	ID_PagesPerChunk
};

class WizardFrame : public wxFrame
{
	friend class PathDropTarget;

public:
	WizardFrame(const wxString &title, const wxPoint &pos, const wxSize &size);

private:
	// UI Elements
	wxPanel *mainPanel;
	wxStaticText *titleText;
	wxStaticText *contentText;
	wxStaticText *stageStatusText;
	wxButton *actionButton;
	wxButton *changeFileButton;
	wxButton *prevButton;
	wxStaticText *stageCounterText;
	wxButton *nextButton;
	wxGauge *progressBar;
	wxStaticText *logLabel;
	wxTextCtrl *logTextCtrl;
	wxStatusBar *m_statusBar;

	// State Variables
	WizardController m_controller;
	PdfChunkSplitter m_splitter;
	wxString m_lastFolder;
	wxString m_lastSpreadsheet;
	long m_pagesPerChunk;

	// Initialization & Layout
	void SetupLayout();
	void BindEvents();

	// Event Handlers
	void OnActionClick(wxCommandEvent &event);
	void OnChangeFileClick(wxCommandEvent &event);
	void OnPrevClick(wxCommandEvent &event);
	void OnNextClick(wxCommandEvent &event);
	void OnAllowedExtensions(wxCommandEvent &event);
	void OnPagesPerChunk(wxCommandEvent &event);
	void OnExit(wxCommandEvent &event);
	void OnAbout(wxCommandEvent &event);
	void OnHelpTopics(wxCommandEvent &event);
	void OnClose(wxCloseEvent &event);

	// Stage Actions
	void ChooseFolder();
	void ApplyFolder(const wxString &path);
	void OfferSplit();
	void ChooseSpreadsheet();
	void ApplySpreadsheet(const wxString &path);
	void ChooseFields();
	void ChooseFormat();
	void StartRenaming();

	// Helper Functions
	void RefreshStage();
	void SetUIBusy(bool busy);
	void UpdateStatusBar(const wxString &text);
	void AppendLog(const wxString &text, bool isError = false);
	void ShowError(const wxString &title, const wxString &message);

	// Settings Persistence
	void LoadSettings();
	void SaveSettings();
};

// Accepts a dropped folder on the first stage and a dropped spreadsheet on the second
class PathDropTarget : public wxFileDropTarget
{
public:
	PathDropTarget(WizardFrame *owner);
	virtual bool OnDropFiles(wxCoord x, wxCoord y, const wxArrayString &filenames) override;

private:
	WizardFrame *m_owner;
};

#endif // WIZARDFRAME_H
