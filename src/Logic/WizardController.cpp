#include "WizardController.h"

#include <wx/log.h>

#include <algorithm>
#include <string>
#include <vector>

const std::array<WizardController::StageTransition, 3> WizardController::ForwardTransitions = {{
	{WizardStage::SelectFolder, WizardStage::SelectData, &WizardController::folderReady},
	{WizardStage::SelectData, WizardStage::BuildFormat, &WizardController::dataReady},
	{WizardStage::BuildFormat, WizardStage::Confirm, &WizardController::formatReady},
}};

const std::array<WizardController::StageTransition, 3> WizardController::BackwardTransitions = {{
	{WizardStage::SelectData, WizardStage::SelectFolder, nullptr},
	{WizardStage::BuildFormat, WizardStage::SelectData, nullptr},
	{WizardStage::Confirm, WizardStage::BuildFormat, nullptr},
}};

WizardController::WizardController()
	: m_allowedExtensions(BatchRenamerLogic::DefaultAllowedExtensions)
{
}

std::string WizardController::StageTitle(WizardStage stage)
{
	switch (stage)
	{
	case WizardStage::SelectFolder:
		return "Select Folder to Process";
	case WizardStage::SelectData:
		return "Select Spreadsheet";
	case WizardStage::BuildFormat:
		return "Define Output Format";
	case WizardStage::Confirm:
		return "Summary and Confirmation";
	}
	return "";
}

std::string WizardController::StageInstructions(WizardStage stage)
{
	switch (stage)
	{
	case WizardStage::SelectFolder:
		return "Select the folder containing the files to rename.\nAll files must share one allowed extension.";
	case WizardStage::SelectData:
		return "Select the spreadsheet (.xlsx or .csv) to use as a base.\nThen, select the desired columns.";
	case WizardStage::BuildFormat:
		return "Arrange the selected columns and type the separators between them.";
	case WizardStage::Confirm:
		return "Review the final information and click 'Start renaming files'.";
	}
	return "";
}

// Secondary status text for the current stage
std::string WizardController::StageStatus() const
{
	switch (m_stage)
	{
	case WizardStage::SelectFolder:
		if (m_folder.empty())
			return "No folder selected";
		return "Selected folder: " + m_folder.u8string() + "\nFiles found: " + std::to_string(m_files.size());
	case WizardStage::SelectData:
	{
		if (m_spreadsheet.empty())
			return "No file selected";
		std::vector<std::string> selected = m_selection.Selected();
		return "Selected file: " + m_spreadsheet.filename().u8string() + "\nSelected columns: " +
			   (selected.empty() ? std::string("none") : BatchRenamerLogic::JoinList(selected, ", "));
	}
	case WizardStage::BuildFormat:
	{
		std::vector<std::string> selected = m_selection.Selected();
		return "Selected columns: " + (selected.empty() ? std::string("No columns selected") : BatchRenamerLogic::JoinList(selected, ", ")) +
			   "\nFinal name: " + (m_template ? m_template->ToString() : std::string("No final name defined"));
	}
	case WizardStage::Confirm:
		return Summary();
	}
	return "";
}

bool WizardController::folderReady() const
{
	return !m_folder.empty() && m_files.size() > 1;
}

bool WizardController::dataReady() const
{
	return !m_spreadsheet.empty() && m_selection.SelectedCount() > 0;
}

bool WizardController::formatReady() const
{
	return m_template.has_value() && !m_template->IsEmpty();
}

const WizardController::StageTransition *WizardController::findTransition(const std::array<StageTransition, 3> &table) const
{
	for (const auto &transition : table)
	{
		if (transition.From == m_stage)
			return &transition;
	}
	return nullptr;
}

bool WizardController::CanAdvance() const
{
	const StageTransition *transition = findTransition(ForwardTransitions);
	return transition && (!transition->Guard || (this->*transition->Guard)());
}

bool WizardController::CanGoBack() const
{
	const StageTransition *transition = findTransition(BackwardTransitions);
	return transition && (!transition->Guard || (this->*transition->Guard)());
}

bool WizardController::Advance()
{
	if (!CanAdvance())
	{
		return false;
	}
	m_stage = findTransition(ForwardTransitions)->To;
	wxLogVerbose("Wizard advanced to '%s'", StageTitle(m_stage).c_str());
	return true;
}

bool WizardController::GoBack()
{
	if (!CanGoBack())
	{
		return false;
	}
	m_stage = findTransition(BackwardTransitions)->To;
	wxLogVerbose("Wizard went back to '%s'", StageTitle(m_stage).c_str());
	return true;
}

void WizardController::SetAllowedExtensions(const std::vector<std::string> &extensions)
{
	m_allowedExtensions.clear();
	for (const auto &extension : extensions)
	{
		std::string normalised = BatchRenamerLogic::NormaliseExtension(extension);
		if (!normalised.empty() && std::find(m_allowedExtensions.begin(), m_allowedExtensions.end(), normalised) == m_allowedExtensions.end())
			m_allowedExtensions.push_back(normalised);
	}
	if (m_allowedExtensions.empty())
	{
		m_allowedExtensions = BatchRenamerLogic::DefaultAllowedExtensions;
	}
}

void WizardController::clearFolder()
{
	m_folder.clear();
	m_files.clear();
	m_extension.clear();
}

bool WizardController::IsSplitEligible() const
{
	return m_files.size() == 1 && m_extension == BatchRenamerLogic::SplittableExtension;
}

FolderSelectionResult WizardController::SelectFolder(const fs::path &folder)
{
	FolderSelectionResult results;
	wxLogVerbose("Folder selected: %s", folder.string().c_str());

	DiscoveryResult discovery = BatchRenamerLogic::discoverFiles(folder, m_allowedExtensions);
	if (!discovery.success)
	{
		clearFolder();
		results.errorKind = discovery.errorKind;
		results.errorMessage = discovery.errorMessage;
		return results;
	}

	// A template is tied to the extension it was built for
	if (discovery.extension != m_extension)
	{
		ClearTemplate();
	}

	m_folder = folder;
	m_files = std::move(discovery.files);
	m_extension = discovery.extension;

	results.fileCount = m_files.size();
	results.extension = m_extension;
	results.splitEligible = IsSplitEligible();
	results.success = true;
	wxLogMessage("%d file(s) found in %s", (int)m_files.size(), m_folder.string().c_str());
	return results;
}

// Splits the lone discovered file into <folder>/split and continues with that folder
SplitResult WizardController::SplitSingleFile(int pagesPerChunk, ChunkSplitter &splitter)
{
	SplitResult results;
	if (!IsSplitEligible())
	{
		results.errorKind = BatchErrorKind::InvalidState;
		results.errorMessage = "Splitting requires exactly one '" + BatchRenamerLogic::SplittableExtension + "' file.";
		return results;
	}
	if (pagesPerChunk < 1)
	{
		results.errorKind = BatchErrorKind::SplitFailure;
		results.errorMessage = "Pages per file must be at least 1.";
		return results;
	}

	const fs::path outputFolder = m_folder / "split";
	results = splitter.split(m_files.front().FullPath, outputFolder, pagesPerChunk);
	if (!results.success)
	{
		if (results.errorKind == BatchErrorKind::None)
			results.errorKind = BatchErrorKind::SplitFailure;
		wxLogError("Could not split %s: %s", m_files.front().FullPath.string().c_str(), results.errorMessage.c_str());
		return results;
	}

	FolderSelectionResult rediscovery = SelectFolder(outputFolder);
	if (!rediscovery.success)
	{
		results.success = false;
		results.errorKind = BatchErrorKind::SplitFailure;
		results.errorMessage = "The split files could not be loaded: " + rediscovery.errorMessage;
	}
	return results;
}

void WizardController::DeclineSplit()
{
	wxLogVerbose("Split declined; a single file cannot be processed");
	clearFolder();
}

StepResult WizardController::SelectSpreadsheet(const fs::path &spreadsheet)
{
	StepResult results;
	wxLogVerbose("Spreadsheet selected: %s", spreadsheet.string().c_str());

	TableLoadResult load = BatchRenamerLogic::loadTable(spreadsheet);

	// Any new choice invalidates the previous columns and format
	m_selection = FieldSelection();
	ClearTemplate();
	if (!load.success)
	{
		m_spreadsheet.clear();
		m_table = DataTable();
		results.errorKind = load.errorKind;
		results.errorMessage = load.errorMessage;
		return results;
	}

	m_spreadsheet = spreadsheet;
	m_table = std::move(load.table);
	m_selection = FieldSelection(m_table.Columns);
	results.success = true;
	wxLogMessage("Loaded %d row(s) and %d column(s) from %s", (int)m_table.Rows.size(), (int)m_table.Columns.size(), m_spreadsheet.filename().string().c_str());
	return results;
}

bool WizardController::ToggleField(const std::string &field)
{
	if (!m_selection.Toggle(field))
	{
		wxLogWarning("Column '%s' is not in the spreadsheet", field.c_str());
		return false;
	}
	ClearTemplate();
	wxLogVerbose("Column '%s' %s", field.c_str(), m_selection.IsSelected(field) ? "selected" : "deselected");
	return true;
}

TemplateBuilder WizardController::BeginTemplate() const
{
	return TemplateBuilder(m_selection.Selected(), m_extension);
}

ValidationResult WizardController::AcceptTemplate(const NameTemplate &nameTemplate)
{
	ValidationResult results = BatchRenamerLogic::validateTemplate(nameTemplate);
	if (!results.success)
	{
		return results;
	}
	m_template = nameTemplate;
	wxLogMessage("Selected filename format: %s", nameTemplate.ToString().c_str());
	return results;
}

void WizardController::ClearTemplate()
{
	m_template.reset();
}

RenameReport WizardController::ExecuteRename(const RenameProgressCallback &onRenamed)
{
	RenameReport report;
	if (m_stage != WizardStage::Confirm || !formatReady())
	{
		report.errorKind = BatchErrorKind::InvalidState;
		report.errorMessage = "Renaming is only possible from the confirmation stage with a complete format.";
		return report;
	}

	GenerationResult generation = BatchRenamerLogic::generateNames(m_table, m_selection.Selected(), *m_template);
	if (!generation.success)
	{
		report.missingColumns = generation.missingColumns;
		report.errorKind = generation.errorKind;
		report.errorMessage = generation.errorMessage;
		return report;
	}
	report.generatedNames = generation.names;

	std::vector<fs::path> files;
	files.reserve(m_files.size());
	for (const auto &entry : m_files)
		files.push_back(entry.FullPath);

	RenameExecutionResult execution = BatchRenamerLogic::performRename(files, generation.names, onRenamed);
	report.completedRenames = execution.successfulRenameOps;
	report.failedIndex = execution.failedIndex;
	report.failedPath = execution.failedPath;
	report.success = execution.overallSuccess;
	report.errorKind = execution.errorKind;
	report.errorMessage = execution.errorMessage;

	if (report.success)
		wxLogMessage("Renamed %d file(s)", (int)report.completedRenames.size());
	else
		wxLogError("Renaming stopped after %d file(s): %s", (int)report.completedRenames.size(), report.errorMessage.c_str());

	// Any completed rename makes the discovered paths stale, even when the batch stopped early
	if (!report.completedRenames.empty())
		refreshFiles();
	return report;
}

void WizardController::refreshFiles()
{
	DiscoveryResult refreshed = BatchRenamerLogic::discoverFiles(m_folder, m_allowedExtensions);
	if (refreshed.success)
	{
		m_files = std::move(refreshed.files);
	}
	else
	{
		wxLogWarning("Could not refresh %s after renaming: %s", m_folder.string().c_str(), refreshed.errorMessage.c_str());
	}
}

std::string WizardController::Summary() const
{
	std::string summary = "Folder: " + (m_folder.empty() ? std::string("(none)") : m_folder.u8string());
	summary += "\nFiles: " + std::to_string(m_files.size());
	if (!m_extension.empty())
		summary += " (" + m_extension + ")";
	summary += "\nSpreadsheet: " + (m_spreadsheet.empty() ? std::string("(none)") : m_spreadsheet.u8string());
	std::vector<std::string> selected = m_selection.Selected();
	summary += "\nColumns: " + (selected.empty() ? std::string("(none)") : BatchRenamerLogic::JoinList(selected, ", "));
	summary += "\nOutput format: " + (m_template ? m_template->ToString() : std::string("(none)"));
	return summary;
}
