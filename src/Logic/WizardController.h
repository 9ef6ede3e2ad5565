#ifndef WIZARDCONTROLLER_H
#define WIZARDCONTROLLER_H

#include "BatchRenamerLogic.h"
#include "ChunkSplitter.h"
#include "TemplateBuilder.h"

#include <array>
#include <vector>
#include <string>
#include <optional>
#include <filesystem>

namespace fs = std::filesystem;

enum class WizardStage
{
	SelectFolder,
	SelectData,
	BuildFormat,
	Confirm
};

struct FolderSelectionResult
{
	std::size_t fileCount = 0;
	std::string extension;
	bool splitEligible = false; // Exactly one file of a splittable type
	bool success = false;
	BatchErrorKind errorKind = BatchErrorKind::None;
	std::string errorMessage;
};

struct StepResult
{
	bool success = false;
	BatchErrorKind errorKind = BatchErrorKind::None;
	std::string errorMessage;
};

struct RenameReport
{
	std::vector<std::string> generatedNames;
	std::vector<RenameOperation> completedRenames;
	std::vector<std::string> missingColumns;
	std::optional<std::size_t> failedIndex;
	fs::path failedPath;
	bool success = false;
	BatchErrorKind errorKind = BatchErrorKind::None;
	std::string errorMessage;
};

// Owns the state of one renaming session and the four-stage wizard over it.
// Stages move one step at a time; forward steps are guarded by a readiness predicate.
class WizardController
{
public:
	WizardController();

	WizardStage Stage() const { return m_stage; }
	std::size_t StageIndex() const { return static_cast<std::size_t>(m_stage); }
	static std::size_t StageCount() { return 4; }
	static std::string StageTitle(WizardStage stage);
	static std::string StageInstructions(WizardStage stage);
	std::string StageStatus() const;

	bool CanAdvance() const;
	bool CanGoBack() const;
	bool Advance();
	bool GoBack();

	void SetAllowedExtensions(const std::vector<std::string> &extensions);
	const std::vector<std::string> &AllowedExtensions() const { return m_allowedExtensions; }

	FolderSelectionResult SelectFolder(const fs::path &folder);
	SplitResult SplitSingleFile(int pagesPerChunk, ChunkSplitter &splitter);
	void DeclineSplit();
	StepResult SelectSpreadsheet(const fs::path &spreadsheet);
	bool ToggleField(const std::string &field);
	TemplateBuilder BeginTemplate() const;
	ValidationResult AcceptTemplate(const NameTemplate &nameTemplate);
	void ClearTemplate();
	RenameReport ExecuteRename(const RenameProgressCallback &onRenamed = nullptr);
	std::string Summary() const;

	const fs::path &Folder() const { return m_folder; }
	const std::vector<FileEntry> &Files() const { return m_files; }
	const std::string &Extension() const { return m_extension; }
	bool IsSplitEligible() const;
	const fs::path &Spreadsheet() const { return m_spreadsheet; }
	const DataTable &Table() const { return m_table; }
	const FieldSelection &Fields() const { return m_selection; }
	const std::optional<NameTemplate> &Template() const { return m_template; }

private:
	struct StageTransition
	{
		WizardStage From;
		WizardStage To;
		bool (WizardController::*Guard)() const; // nullptr: always allowed
	};

	static const std::array<StageTransition, 3> ForwardTransitions;
	static const std::array<StageTransition, 3> BackwardTransitions;

	bool folderReady() const;
	bool dataReady() const;
	bool formatReady() const;
	const StageTransition *findTransition(const std::array<StageTransition, 3> &table) const;
	void clearFolder();
	void refreshFiles();

	WizardStage m_stage = WizardStage::SelectFolder;
	std::vector<std::string> m_allowedExtensions;
	fs::path m_folder;
	std::vector<FileEntry> m_files;
	std::string m_extension;
	fs::path m_spreadsheet;
	DataTable m_table;
	FieldSelection m_selection;
	std::optional<NameTemplate> m_template;
};

#endif // WIZARDCONTROLLER_H
