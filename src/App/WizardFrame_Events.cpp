#include <wx/wxprec.h>

#ifndef WX_PRECOMP
#include <wx/wx.h>
#endif

#include <wx/msgdlg.h>
#include <wx/filedlg.h>
#include <wx/dirdlg.h>
#include <wx/aboutdlg.h>
#include <wx/filename.h>
#include <wx/textdlg.h>
#include <wx/numdlg.h>
#include <wx/textctrl.h>
#include <wx/button.h>

#include "WizardFrame.h"
#include "HelpDialog.h"
#include "FieldSelectorDialog.h"
#include "TemplateBuilderDialog.h"

#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// The stage button does whatever the current stage needs next
void WizardFrame::OnActionClick(wxCommandEvent &WXUNUSED(event))
{
	switch (m_controller.Stage())
	{
	case WizardStage::SelectFolder:
		ChooseFolder();
		break;
	case WizardStage::SelectData:
		if (m_controller.Spreadsheet().empty())
			ChooseSpreadsheet();
		else
			ChooseFields();
		break;
	case WizardStage::BuildFormat:
		ChooseFormat();
		break;
	case WizardStage::Confirm:
		StartRenaming();
		break;
	}
}

void WizardFrame::OnChangeFileClick(wxCommandEvent &WXUNUSED(event))
{
	ChooseSpreadsheet();
}

void WizardFrame::OnPrevClick(wxCommandEvent &WXUNUSED(event))
{
	if (!m_controller.GoBack())
	{
		UpdateStatusBar("Already at the first stage.");
		return;
	}
	UpdateStatusBar(WizardController::StageTitle(m_controller.Stage()));
	RefreshStage();
}

void WizardFrame::OnNextClick(wxCommandEvent &WXUNUSED(event))
{
	if (!m_controller.Advance())
	{
		UpdateStatusBar("Complete this stage before continuing.");
		return;
	}
	UpdateStatusBar(WizardController::StageTitle(m_controller.Stage()));
	RefreshStage();
}

void WizardFrame::ChooseFolder()
{
	wxDirDialog dirDialog(this, "Select folder containing files to rename", m_lastFolder, wxDD_DEFAULT_STYLE | wxDD_DIR_MUST_EXIST);
	if (dirDialog.ShowModal() == wxID_CANCEL)
	{
		UpdateStatusBar("Folder selection cancelled.");
		return;
	}
	ApplyFolder(dirDialog.GetPath());
}

void WizardFrame::ApplyFolder(const wxString &path)
{
	AppendLog("Selected folder: " + path);
	SetUIBusy(true);
	FolderSelectionResult result = m_controller.SelectFolder(fs::path(path.ToStdWstring()));
	SetUIBusy(false);

	if (!result.success)
	{
		ShowError("Folder Error", wxString::FromUTF8(result.errorMessage));
		RefreshStage();
		return;
	}
	m_lastFolder = path;

	if (result.splitEligible)
	{
		OfferSplit();
	}
	else if (result.fileCount == 1)
	{
		m_controller.DeclineSplit();
		ShowError("Error", "Only one file was found. At least two files are needed.");
	}
	else
	{
		AppendLog(wxString::Format("%d '%s' file(s) found.", (int)result.fileCount, result.extension));
		UpdateStatusBar(wxString::Format("%d files found", (int)result.fileCount));
		wxMessageBox(wxString::Format("%d files found", (int)result.fileCount), "Success", wxOK | wxICON_INFORMATION, this);
	}
	RefreshStage();
}

// A lone PDF can only be processed after splitting it into several files
void WizardFrame::OfferSplit()
{
	int answer = wxMessageBox("Only one PDF file was found.\nDo you want to split it into several files?",
							  "Split PDF", wxYES_NO | wxICON_QUESTION | wxCENTRE, this);
	long pages = -1;
	if (answer == wxYES)
	{
		pages = wxGetNumberFromUser("Number of pages per file:", "Pages:", "Split PDF", m_pagesPerChunk, 1, 100000, this);
	}
	if (pages < 1)
	{
		m_controller.DeclineSplit();
		ShowError("Error", "The PDF was not split. Cannot process a single file.");
		return;
	}

	AppendLog(wxString::Format("Splitting into files of %ld page(s)...", pages));
	SetUIBusy(true);
	SplitResult result = m_controller.SplitSingleFile((int)pages, m_splitter);
	SetUIBusy(false);

	if (!result.success)
	{
		ShowError("Split", "Could not split the file.\n" + wxString::FromUTF8(result.errorMessage));
		return;
	}
	m_pagesPerChunk = pages;
	m_lastFolder = wxString(m_controller.Folder().wstring());
	AppendLog(wxString::Format("Split %d page(s) into %d file(s) in %s", (int)result.pageCount, (int)result.chunkFiles.size(), m_lastFolder));
	UpdateStatusBar(wxString::Format("%d files found", (int)m_controller.Files().size()));
	wxMessageBox("The PDF was split successfully.", "Split Completed", wxOK | wxICON_INFORMATION, this);
}

void WizardFrame::ChooseSpreadsheet()
{
	wxString defaultDir;
	wxString defaultFile;
	if (!m_lastSpreadsheet.IsEmpty())
	{
		wxFileName last(m_lastSpreadsheet);
		defaultDir = last.GetPath();
		defaultFile = last.GetFullName();
	}
	wxFileDialog openFileDialog(this, "Select spreadsheet (.xlsx or .csv)", defaultDir, defaultFile,
								"Spreadsheets (*.xlsx;*.csv)|*.xlsx;*.csv|All files (*.*)|*.*", wxFD_OPEN | wxFD_FILE_MUST_EXIST);
	if (openFileDialog.ShowModal() == wxID_CANCEL)
	{
		UpdateStatusBar("File selection cancelled.");
		return;
	}
	ApplySpreadsheet(openFileDialog.GetPath());
}

void WizardFrame::ApplySpreadsheet(const wxString &path)
{
	AppendLog("Selected spreadsheet: " + path);
	SetUIBusy(true);
	StepResult result = m_controller.SelectSpreadsheet(fs::path(path.ToStdWstring()));
	SetUIBusy(false);

	if (!result.success)
	{
		ShowError("Error loading file", wxString::FromUTF8(result.errorMessage));
		RefreshStage();
		return;
	}
	m_lastSpreadsheet = path;
	const DataTable &table = m_controller.Table();
	AppendLog(wxString::Format("Loaded %d row(s) with %d column(s).", (int)table.Rows.size(), (int)table.Columns.size()));
	UpdateStatusBar("Spreadsheet loaded. Select the columns to use.");
	RefreshStage();
}

void WizardFrame::ChooseFields()
{
	FieldSelectorDialog dialog(this, m_controller.Fields());
	if (dialog.ShowModal() != wxID_OK)
	{
		UpdateStatusBar("Column selection cancelled.");
		return;
	}

	// Apply the difference between the dialog's selection and the current one
	const FieldSelection &chosen = dialog.GetSelection();
	for (const auto &field : chosen.Available())
	{
		if (chosen.IsSelected(field) != m_controller.Fields().IsSelected(field))
			m_controller.ToggleField(field);
	}

	std::vector<std::string> selected = m_controller.Fields().Selected();
	if (selected.empty())
	{
		wxMessageBox("No items selected", "Info", wxOK | wxICON_INFORMATION, this);
	}
	else
	{
		AppendLog("Selected columns: " + wxString::FromUTF8(BatchRenamerLogic::JoinList(selected, ", ")));
		wxMessageBox(wxString::Format("%d items selected", (int)selected.size()), "Success", wxOK | wxICON_INFORMATION, this);
	}
	RefreshStage();
}

void WizardFrame::ChooseFormat()
{
	TemplateBuilderDialog dialog(this, m_controller.BeginTemplate());
	if (dialog.ShowModal() != wxID_OK)
	{
		if (!m_controller.Template())
			wxMessageBox("No filename defined", "Info", wxOK | wxICON_INFORMATION, this);
		RefreshStage();
		return;
	}

	ValidationResult result = m_controller.AcceptTemplate(dialog.GetTemplate());
	if (!result.success)
	{
		ShowError("Format Error", wxString::FromUTF8(result.errorMessage));
	}
	else
	{
		AppendLog("Selected filename format: " + wxString::FromUTF8(m_controller.Template()->ToString()));
		UpdateStatusBar("Format defined.");
	}
	RefreshStage();
}

void WizardFrame::StartRenaming()
{
	wxString confirmMsg = wxString::Format("Are you sure you want to rename %d file(s)?", (int)m_controller.Files().size());
	confirmMsg += "\n\nWARNING: This operation cannot be undone.";
	if (wxMessageBox(confirmMsg, "Confirm Rename Operation", wxYES_NO | wxICON_QUESTION | wxCENTRE, this) != wxYES)
	{
		AppendLog("Rename operation cancelled by user.");
		UpdateStatusBar("Rename cancelled.");
		return;
	}

	AppendLog("Renaming files...");
	SetUIBusy(true);
	RenameReport report = m_controller.ExecuteRename([this](const RenameOperation &op, std::size_t total) {
		UpdateStatusBar(wxString::Format("Renamed %d of %d file(s)...", (int)op.Index + 1, (int)total));
	});
	SetUIBusy(false);

	for (const auto &op : report.completedRenames)
	{
		AppendLog(wxString::FromUTF8(op.OldName) + " -> " + wxString::FromUTF8(op.NewName));
	}

	if (!report.success)
	{
		wxString message = wxString::FromUTF8(report.errorMessage);
		if (report.errorKind == BatchErrorKind::MissingColumn)
		{
			ShowError("Missing Columns", message);
		}
		else
		{
			if (!report.completedRenames.empty())
				message += wxString::Format("\n\n%d file(s) were renamed before the failure.", (int)report.completedRenames.size());
			ShowError("Rename Error", message);
		}
		RefreshStage();
		return;
	}

	AppendLog(wxString::Format("Renamed %d file(s).", (int)report.completedRenames.size()));
	UpdateStatusBar("Renaming complete.");
	wxMessageBox("Files renamed successfully.", "Success", wxOK | wxICON_INFORMATION, this);
	RefreshStage();
}

void WizardFrame::OnAllowedExtensions(wxCommandEvent &WXUNUSED(event))
{
	wxString current = BatchRenamerLogic::JoinList(m_controller.AllowedExtensions(), ", ");
	wxTextEntryDialog dialog(this, "Comma-separated file extensions that may be renamed:", "Allowed Extensions", current);
	if (dialog.ShowModal() != wxID_OK)
		return;

	m_controller.SetAllowedExtensions(BatchRenamerLogic::ParseExtensionList(std::string(dialog.GetValue().utf8_str())));
	wxString applied = BatchRenamerLogic::JoinList(m_controller.AllowedExtensions(), ", ");
	AppendLog("Allowed extensions: " + applied + " (applies to the next folder selection)");
	UpdateStatusBar("Allowed extensions: " + applied);
}

void WizardFrame::OnPagesPerChunk(wxCommandEvent &WXUNUSED(event))
{
	long pages = wxGetNumberFromUser("Default number of pages per file when splitting a PDF:", "Pages:", "Pages per Split File", m_pagesPerChunk, 1, 100000, this);
	if (pages < 1)
		return;
	m_pagesPerChunk = pages;
	UpdateStatusBar(wxString::Format("Pages per split file: %ld", pages));
}

void WizardFrame::OnExit(wxCommandEvent &WXUNUSED(event))
{
	Close(true);
}

void WizardFrame::OnAbout(wxCommandEvent &WXUNUSED(event))
{
	wxAboutDialogInfo i;
	i.SetName("Batch File Renamer");
	i.SetVersion("1.0.0");
	i.SetDescription("Renames every file in a folder using the rows of a spreadsheet.\nCan split a single PDF into several files first.");
	wxAboutBox(i, this);
}

void WizardFrame::OnHelpTopics(wxCommandEvent &WXUNUSED(event))
{
	const wxString helpContent =
		"----------------------------------\n"
		" Batch File Renamer - Help\n"
		"----------------------------------\n\n"
		"Renames all files of a folder in natural order (file2 before file10) using one spreadsheet row per file.\n"
		"The wizard has four stages; use Previous and Next (Alt+Left / Alt+Right) to move between them.\n\n"

		"======================\n"
		" Select Folder to Process\n"
		"======================\n"
		"  - Choose the folder, or drop it onto the window.\n"
		"  - Every file in the folder must have the same extension, and the extension must be allowed (File > Allowed Extensions; default .pdf).\n"
		"  - Subfolders are ignored.\n"
		"  - If the folder holds a single PDF you can split it into files of N pages. The pieces are written to a 'split' subfolder named split_1.pdf, split_2.pdf, ... and that subfolder becomes the working folder.\n\n"

		"======================\n"
		" Select Spreadsheet\n"
		"======================\n"
		"  - Choose an .xlsx or .csv file, or drop it onto the window. The first row holds the column names.\n"
		"  - Row 1 below the header names the first file, row 2 the second, and so on.\n"
		"  - Then select the columns to use. Search filters the list; 20 columns are shown per page.\n\n"

		"======================\n"
		" Define Output Format\n"
		"======================\n"
		"  - Drag the column boxes into the desired order.\n"
		"  - Type separators between them. Only letters, digits, '-', '_', ',', ';' and spaces are accepted.\n"
		"  - The extension of the files is kept.\n\n"

		"======================\n"
		" Summary and Confirmation\n"
		"======================\n"
		"  - Review the summary and click 'Start renaming files'.\n"
		"  - The number of files must equal the number of spreadsheet rows.\n"
		"  - Before anything is renamed the new names are checked: no name may be empty or repeated, and no target may already exist.\n"
		"  - Renaming stops at the first failure; files renamed before it keep their new names.\n"
		"  - There is no undo. Every rename is recorded in batch_renamer.log in the application data folder.\n";

	HelpDialog dlg(this, wxID_ANY, "Batch File Renamer - Help", helpContent, wxString(WizardController::StageTitle(m_controller.Stage())));
	dlg.ShowModal();
}

void WizardFrame::OnClose(wxCloseEvent &event)
{
	SaveSettings(); // Save window position, size, and last used inputs to config
	event.Skip();	// Allow the window to close after performing cleanup
}
