#include "BatchRenamerLogic.h"

#include <wx/log.h>

#include <vector>
#include <string>
#include <filesystem>
#include <set>
#include <system_error> // For std::error_code
#include <stdexcept>	// For std::exception safety

namespace fs = std::filesystem;

namespace
{
	void FailAt(RenameExecutionResult &results, std::size_t index, const fs::path &path, const std::string &reason)
	{
		results.failedIndex = index;
		results.failedPath = path;
		results.errorKind = BatchErrorKind::RenameFailure;
		results.errorMessage = "File #" + std::to_string(index + 1) + " (" + path.u8string() + "): " + reason;
	}
}

// Renames orderedFiles[i] to orderedNewNames[i] + its own extension, strictly in order
RenameExecutionResult BatchRenamerLogic::performRename(const std::vector<fs::path> &orderedFiles, std::vector<std::string> orderedNewNames,
													   const RenameProgressCallback &onRenamed)
{
	RenameExecutionResult results;
	results.overallSuccess = false; // Default to false; set to true only if all operations succeed

	// A blank first name is a known artifact of name generation and is treated as padding
	if (!orderedNewNames.empty() && orderedNewNames.front().empty())
	{
		orderedNewNames.erase(orderedNewNames.begin());
	}

	if (orderedFiles.size() != orderedNewNames.size())
	{
		results.errorKind = BatchErrorKind::CountMismatch;
		results.errorMessage = "The number of files (" + std::to_string(orderedFiles.size()) +
							   ") does not match the number of new names (" + std::to_string(orderedNewNames.size()) + ").";
		return results;
	}

	// Build and validate the whole plan before touching the filesystem
	std::vector<RenameOperation> plan;
	plan.reserve(orderedFiles.size());
	std::set<fs::path> destinations;
	for (std::size_t i = 0; i < orderedFiles.size(); ++i)
	{
		const fs::path &source = orderedFiles[i];
		RenameOperation op;
		op.Index = i;
		op.OldFullPath = source;
		op.OldName = source.filename().u8string();
		op.NewName = orderedNewNames[i] + source.extension().u8string();
		op.NewFullPath = source.parent_path() / fs::u8path(op.NewName);

		if (orderedNewNames[i].empty())
		{
			FailAt(results, i, source, "Generated name is empty.");
			return results;
		}
		if (!destinations.insert(op.NewFullPath).second)
		{
			FailAt(results, i, source, "Target name '" + op.NewName + "' is produced more than once.");
			return results;
		}
		if (op.OldFullPath != op.NewFullPath)
		{
			std::error_code targetExistEc;
			bool targetExists = fs::exists(op.NewFullPath, targetExistEc);
			if (targetExistEc)
			{
				FailAt(results, i, source, "Filesystem error checking target path (" + op.NewFullPath.u8string() + "): " + targetExistEc.message());
				return results;
			}
			if (targetExists)
			{
				FailAt(results, i, source, "Target path already exists (" + op.NewFullPath.u8string() + ").");
				return results;
			}
		}
		plan.push_back(op);
	}

	for (const auto &op : plan)
	{
		try
		{
			std::error_code existEc, targetExistEc, renameEc;

			// Verify that the source file still exists and is a regular file before attempting to rename
			bool sourceExists = fs::exists(op.OldFullPath, existEc);
			if (existEc || !sourceExists)
			{
				FailAt(results, op.Index, op.OldFullPath, existEc ? "Filesystem error checking source existence: " + existEc.message() : "Source file disappeared.");
				return results;
			}

			if (op.OldFullPath == op.NewFullPath)
			{
				// Name already matches; nothing to do
				wxLogVerbose("Skipping identity rename for '%s'", op.OldName.c_str());
				results.successfulRenameOps.push_back(op);
				if (onRenamed)
					onRenamed(op, plan.size());
				continue;
			}

			// The target may have appeared since the plan was validated
			bool targetExists = fs::exists(op.NewFullPath, targetExistEc);
			if (targetExistEc || targetExists)
			{
				FailAt(results, op.Index, op.OldFullPath, "Target path already exists (" + op.NewFullPath.u8string() + ").");
				return results;
			}

			fs::rename(op.OldFullPath, op.NewFullPath, renameEc);
			if (renameEc)
			{
				FailAt(results, op.Index, op.OldFullPath, "Rename failed: " + renameEc.message());
				return results;
			}

			wxLogMessage("Renaming: %s -> %s", op.OldFullPath.string().c_str(), op.NewFullPath.string().c_str());
			results.successfulRenameOps.push_back(op);
			if (onRenamed)
				onRenamed(op, plan.size());
		}
		catch (const fs::filesystem_error &ex)
		{
			// Catch specific filesystem exceptions for detailed error reporting
			std::string errMsg = "Filesystem Exception: " + std::string(ex.what());
			if (!ex.path1().empty())
				errMsg += " (Path1: " + ex.path1().u8string() + ")";
			if (!ex.path2().empty())
				errMsg += " (Path2: " + ex.path2().u8string() + ")";
			FailAt(results, op.Index, op.OldFullPath, errMsg);
			return results;
		}
		catch (const std::exception &ex)
		{
			FailAt(results, op.Index, op.OldFullPath, "General Exception: " + std::string(ex.what()));
			return results;
		}
	}

	results.overallSuccess = true;
	return results;
}
