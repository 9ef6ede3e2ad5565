#include <wx/wxprec.h>

#ifndef WX_PRECOMP
#include <wx/wx.h>
#endif

#include <wx/config.h>

#include "WizardFrame.h"
#include "BatchRenamerLogic.h"

#include <string>
#include <vector>

// Loads window position, the last used inputs and the options from config
void WizardFrame::LoadSettings()
{
	wxConfigBase *cfg = wxConfigBase::Get();
	if (!cfg)
		return; // Cannot load settings if config system is unavailable

	// Load window position. Size is handled in WizardFrame constructor after initial Fit()
	int x = cfg->ReadLong("/Window/X", 50);
	int y = cfg->ReadLong("/Window/Y", 50);
	SetPosition(wxPoint(x, y));

	m_lastFolder = cfg->Read("/Inputs/LastFolder", wxEmptyString);
	m_lastSpreadsheet = cfg->Read("/Inputs/LastSpreadsheet", wxEmptyString);

	wxString defaultExtensions = BatchRenamerLogic::JoinList(BatchRenamerLogic::DefaultAllowedExtensions, ",");
	wxString extensions = cfg->Read("/Options/AllowedExtensions", defaultExtensions);
	m_controller.SetAllowedExtensions(BatchRenamerLogic::ParseExtensionList(extensions.ToStdString()));

	m_pagesPerChunk = cfg->ReadLong("/Options/PagesPerChunk", 1);
	if (m_pagesPerChunk < 1)
		m_pagesPerChunk = 1;
}

// Saves window geometry, last used inputs and options to config
void WizardFrame::SaveSettings()
{
	wxConfigBase *cfg = wxConfigBase::Get();
	if (!cfg)
		return; // Cannot save settings if config system is unavailable

	int x, y, w, h;
	GetPosition(&x, &y);
	GetSize(&w, &h);
	cfg->Write("/Window/X", (long)x);
	cfg->Write("/Window/Y", (long)y);
	cfg->Write("/Window/Width", (long)w);
	cfg->Write("/Window/Height", (long)h);

	cfg->Write("/Inputs/LastFolder", m_lastFolder);
	cfg->Write("/Inputs/LastSpreadsheet", m_lastSpreadsheet);
	cfg->Write("/Options/AllowedExtensions", wxString(BatchRenamerLogic::JoinList(m_controller.AllowedExtensions(), ",")));
	cfg->Write("/Options/PagesPerChunk", m_pagesPerChunk);

	// Explicitly flush changes to ensure they are written to persistent storage
	cfg->Flush();
}
