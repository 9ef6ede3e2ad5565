#include <wx/wxprec.h>
#ifdef __WXMSW__
#include <windows.h>
#endif
#ifndef WX_PRECOMP
#include <wx/wx.h>
#endif
#include "App.h"
#include "WizardFrame.h"
#include <wx/config.h>
#include <wx/filename.h>
#include <wx/stdpaths.h>
#include <wx/log.h>

wxIMPLEMENT_APP(App);

bool App::OnInit()
{
#ifdef __WXMSW__
	// Enable per-monitor DPI awareness (V2) on Windows for sharp UI rendering on high-DPI displays
	SetProcessDpiAwarenessContext(DPI_AWARENESS_CONTEXT_PER_MONITOR_AWARE_V2);
#endif

	SetAppName("BatchRenamer");

	// Initialize the configuration system for storing/retrieving application settings
	wxConfigBase::Set(new wxConfig(GetAppName()));

	if (!wxApp::OnInit())
	{
		wxConfigBase::Set(nullptr);
		return false;
	}

	OpenLogFile();

	WizardFrame *frame = new WizardFrame(
		"Batch File Renamer",
		wxPoint(50, 50),
		wxSize(720, 640));
	frame->Show(true);
	return true;
}

// Routes all wxLog output to batch_renamer.log in the per-user data directory
void App::OpenLogFile()
{
	wxString logDir = wxStandardPaths::Get().GetUserDataDir();
	if (!wxFileName::DirExists(logDir) && !wxFileName::Mkdir(logDir, wxS_DIR_DEFAULT, wxPATH_MKDIR_FULL))
	{
		wxLogWarning("Could not create log directory %s; logging to the console only.", logDir);
		return;
	}

	wxFileName logPath(logDir, "batch_renamer.log");
	m_logFile = wxFopen(logPath.GetFullPath(), "a");
	if (!m_logFile)
	{
		wxLogWarning("Could not open log file %s; logging to the console only.", logPath.GetFullPath());
		return;
	}

	m_previousLog = wxLog::SetActiveTarget(new wxLogStderr(m_logFile));
	wxLog::SetVerbose(true);
	wxLogMessage("%s started", GetAppName());
}

int App::OnExit()
{
	if (m_logFile)
	{
		wxLogMessage("%s exiting", GetAppName());
		delete wxLog::SetActiveTarget(m_previousLog);
		fclose(m_logFile);
		m_logFile = nullptr;
	}
	return wxApp::OnExit();
}
