#include <wx/wxprec.h>

#ifndef WX_PRECOMP
#include <wx/wx.h>
#endif

#include <wx/accel.h> // Required for accelerator table
#include <wx/button.h>
#include <wx/config.h>
#include <wx/dnd.h>
#include <wx/event.h>
#include <wx/gauge.h>
#include <wx/menu.h>
#include <wx/panel.h>
#include <wx/settings.h>
#include <wx/sizer.h>
#include <wx/statline.h>
#include <wx/stattext.h>
#include <wx/statusbr.h>
#include <wx/textctrl.h>

#include "WizardFrame.h"

namespace fs = std::filesystem;

// WizardFrame constructor: builds menus, status bar and the single wizard page,
// then restores settings and shows the first stage
WizardFrame::WizardFrame(const wxString &title, const wxPoint &pos,
                         const wxSize &size)
    : wxFrame(NULL, wxID_ANY, title, pos, size), m_pagesPerChunk(1) {
  // Create the menu bar
  wxMenu *menuFile = new wxMenu;
  menuFile->Append(ID_AllowedExtensions, "Allowed &Extensions...");
  menuFile->Append(ID_PagesPerChunk, "&Pages per Split File...");
  menuFile->AppendSeparator();
  menuFile->Append(wxID_EXIT, "E&xit", "Exit this program");

  wxMenu *menuHelp = new wxMenu;
  menuHelp->Append(ID_HelpTopics, "&Help...\tF1");
  menuHelp->AppendSeparator();
  menuHelp->Append(wxID_ABOUT);

  wxMenuBar *menuBar = new wxMenuBar;
  menuBar->Append(menuFile, "&File");
  menuBar->Append(menuHelp, "&Help");
  SetMenuBar(menuBar);

  // Create the status bar
  CreateStatusBar(1);
  m_statusBar = GetStatusBar();
  UpdateStatusBar("Ready");

  mainPanel = new wxPanel(this, wxID_ANY);

  titleText = new wxStaticText(mainPanel, wxID_ANY, "");
  wxFont titleFont = titleText->GetFont();
  titleFont.SetPointSize(titleFont.GetPointSize() + 6);
  titleFont.MakeBold();
  titleText->SetFont(titleFont);
  contentText = new wxStaticText(mainPanel, wxID_ANY, "");
  stageStatusText = new wxStaticText(mainPanel, wxID_ANY, "");
  actionButton = new wxButton(mainPanel, ID_ActionButton, "Select folder");
  changeFileButton = new wxButton(mainPanel, ID_ChangeFileButton, "Change file");
  prevButton = new wxButton(mainPanel, ID_PrevButton, "Previous");
  stageCounterText = new wxStaticText(mainPanel, wxID_ANY, "");
  nextButton = new wxButton(mainPanel, ID_NextButton, "Next");
  progressBar = new wxGauge(mainPanel, wxID_ANY, 100, wxDefaultPosition,
                            wxSize(-1, 16), wxGA_HORIZONTAL | wxGA_SMOOTH);
  progressBar->SetValue(0);
  logLabel = new wxStaticText(mainPanel, wxID_ANY, "Log:");
  logTextCtrl = new wxTextCtrl(mainPanel, wxID_ANY, "", wxDefaultPosition,
                               wxSize(-1, 140),
                               wxTE_MULTILINE | wxTE_READONLY | wxTE_RICH2);

  // Set up the layout of all UI elements
  SetupLayout();

  // A folder or spreadsheet can be dropped anywhere on the window
  mainPanel->SetDropTarget(new PathDropTarget(this));

  // Load last used settings from config, then show the first stage
  LoadSettings();
  RefreshStage();
  mainPanel->Layout();

  // Finalize window sizing, respecting minimum requirements and saved
  // dimensions
  this->Fit();
  wxSize minReqSize = this->GetSize();
  wxConfigBase *config = wxConfigBase::Get();
  int savedW = minReqSize.GetWidth();
  int savedH = 640; // Default height if not saved
  if (config) {
    savedW = config->ReadLong("/Window/Width", minReqSize.GetWidth());
    savedH = config->ReadLong("/Window/Height", 640);
  }
  if (savedW < minReqSize.GetWidth())
    savedW = minReqSize.GetWidth();
  if (savedH < minReqSize.GetHeight())
    savedH = minReqSize.GetHeight();
  if (savedW < 600)
    savedW = 600;
  if (savedH < 480)
    savedH = 480;
  this->SetSize(savedW, savedH);
  this->SetMinSize(minReqSize);

  BindEvents();
}

// Title, instructions, status and action button on top; pager and log below
void WizardFrame::SetupLayout() {
  wxBoxSizer *stageSizer = new wxBoxSizer(wxVERTICAL);
  stageSizer->Add(titleText, 0, wxALIGN_CENTER_HORIZONTAL | wxBOTTOM, 20);
  stageSizer->Add(contentText, 0, wxALIGN_CENTER_HORIZONTAL | wxBOTTOM, 10);
  stageSizer->Add(stageStatusText, 0, wxEXPAND | wxTOP | wxBOTTOM, 10);
  wxBoxSizer *actionSizer = new wxBoxSizer(wxHORIZONTAL);
  actionSizer->Add(actionButton, 0, wxALL, 5);
  actionSizer->Add(changeFileButton, 0, wxALL, 5);
  stageSizer->Add(actionSizer, 0, wxALIGN_CENTER_HORIZONTAL | wxALL, 5);

  wxBoxSizer *pagerSizer = new wxBoxSizer(wxHORIZONTAL);
  pagerSizer->Add(prevButton, 0, wxALL, 5);
  pagerSizer->AddStretchSpacer(1);
  pagerSizer->Add(stageCounterText, 0, wxALIGN_CENTER_VERTICAL | wxALL, 5);
  pagerSizer->AddStretchSpacer(1);
  pagerSizer->Add(nextButton, 0, wxALL, 5);

  wxBoxSizer *logAreaSizer = new wxBoxSizer(wxVERTICAL);
  logAreaSizer->Add(logLabel, 0, wxLEFT | wxRIGHT | wxTOP, 5);
  logAreaSizer->Add(progressBar, 0, wxEXPAND | wxLEFT | wxRIGHT, 5);
  logAreaSizer->Add(logTextCtrl, 1, wxEXPAND | wxALL, 5);

  wxBoxSizer *mainFrameSizer = new wxBoxSizer(wxVERTICAL);
  mainFrameSizer->Add(stageSizer, 1, wxEXPAND | wxALL, 15);
  mainFrameSizer->Add(pagerSizer, 0, wxEXPAND | wxLEFT | wxRIGHT, 10);
  mainFrameSizer->Add(new wxStaticLine(mainPanel), 0, wxEXPAND | wxALL, 5);
  mainFrameSizer->Add(logAreaSizer, 1, wxEXPAND | wxALL, 5);
  mainPanel->SetSizer(mainFrameSizer);
}

// Binds UI events to their respective handler functions
void WizardFrame::BindEvents() {
  // File Menu events
  Bind(wxEVT_MENU, &WizardFrame::OnAllowedExtensions, this,
       ID_AllowedExtensions);
  Bind(wxEVT_MENU, &WizardFrame::OnPagesPerChunk, this, ID_PagesPerChunk);
  Bind(wxEVT_MENU, &WizardFrame::OnExit, this, wxID_EXIT);
  // Help Menu events
  Bind(wxEVT_MENU, &WizardFrame::OnAbout, this, wxID_ABOUT);
  Bind(wxEVT_MENU, &WizardFrame::OnHelpTopics, this, ID_HelpTopics);
  // Window and control events
  Bind(wxEVT_CLOSE_WINDOW, &WizardFrame::OnClose, this);
  actionButton->Bind(wxEVT_BUTTON, &WizardFrame::OnActionClick, this,
                     ID_ActionButton);
  changeFileButton->Bind(wxEVT_BUTTON, &WizardFrame::OnChangeFileClick, this,
                         ID_ChangeFileButton);
  prevButton->Bind(wxEVT_BUTTON, &WizardFrame::OnPrevClick, this,
                   ID_PrevButton);
  nextButton->Bind(wxEVT_BUTTON, &WizardFrame::OnNextClick, this,
                   ID_NextButton);
  // Keyboard accelerators
  wxAcceleratorEntry entries[3];
  entries[0].Set(wxACCEL_NORMAL, WXK_F1, ID_HelpTopics);
  entries[1].Set(wxACCEL_ALT, WXK_LEFT, ID_PrevButton);
  entries[2].Set(wxACCEL_ALT, WXK_RIGHT, ID_NextButton);
  wxAcceleratorTable accel(3, entries);
  this->SetAcceleratorTable(accel);
  Bind(wxEVT_MENU, &WizardFrame::OnPrevClick, this, ID_PrevButton);
  Bind(wxEVT_MENU, &WizardFrame::OnNextClick, this, ID_NextButton);
}
