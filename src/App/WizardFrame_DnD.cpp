#include <wx/wxprec.h>

#ifndef WX_PRECOMP
#include <wx/wx.h>
#endif

#include <wx/dnd.h>
#include <wx/dir.h>		 // For wxDirExists
#include <wx/filefn.h>	 // For wxFileExists
#include <wx/filename.h> // For wxFileName

#include "WizardFrame.h"

PathDropTarget::PathDropTarget(WizardFrame *owner) : m_owner(owner) {}

// What is accepted depends on the stage the wizard is on
bool PathDropTarget::OnDropFiles(wxCoord x, wxCoord y, const wxArrayString &filenames)
{
	if (!m_owner)
		return false;

	if (filenames.GetCount() != 1)
	{
		m_owner->UpdateStatusBar("Drop Error: Please drop a single item.");
		return false;
	}
	wxString droppedPath = filenames[0];

	switch (m_owner->m_controller.Stage())
	{
	case WizardStage::SelectFolder:
		if (!wxDirExists(droppedPath))
		{
			m_owner->UpdateStatusBar("Drop Error: The dropped item is not a valid directory.");
			return false;
		}
		m_owner->ApplyFolder(droppedPath);
		return true;

	case WizardStage::SelectData:
	{
		wxString extension = wxFileName(droppedPath).GetExt().Lower();
		if (!wxFileExists(droppedPath) || (extension != "xlsx" && extension != "csv"))
		{
			m_owner->UpdateStatusBar("Drop Error: Please drop an .xlsx or .csv file.");
			return false;
		}
		m_owner->ApplySpreadsheet(droppedPath);
		return true;
	}

	default:
		m_owner->UpdateStatusBar("Drop Ignored: Nothing can be dropped on this stage.");
		return false;
	}
}
