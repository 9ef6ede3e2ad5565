#include "BatchRenamerLogic.h"

#include <wx/log.h>

#include <filesystem>
#include <string>
#include <vector>
#include <set>
#include <algorithm>    // For std::sort, std::find
#include <system_error> // For std::error_code

namespace fs = std::filesystem;

// Lists the regular files of a directory and checks they form one homogeneous, allowed set
DiscoveryResult BatchRenamerLogic::discoverFiles(const fs::path &directory, const std::vector<std::string> &allowedExtensions)
{
	DiscoveryResult results;

	std::error_code ec;
	bool exists = fs::exists(directory, ec);
	if (ec || !exists)
	{
		results.errorKind = BatchErrorKind::NotFound;
		results.errorMessage = "Directory not found: " + directory.u8string() + (ec ? " (" + ec.message() + ")" : "");
		return results;
	}
	if (!fs::is_directory(directory, ec) || ec)
	{
		results.errorKind = BatchErrorKind::InvalidTarget;
		results.errorMessage = "Not a directory: " + directory.u8string();
		return results;
	}

	// Resolve once so every entry carries an absolute path
	fs::path root = fs::absolute(directory, ec);
	if (ec)
	{
		root = directory;
	}

	std::set<std::string> extensionsFound;
	try
	{
		for (const auto &entry : fs::directory_iterator(root, fs::directory_options::skip_permission_denied))
		{
			std::error_code fileEc;
			if (!entry.is_regular_file(fileEc) || fileEc)
			{
				continue; // Subdirectories (e.g. an earlier split/ output) are not part of the set
			}
			FileEntry file;
			file.FullPath = entry.path();
			file.Extension = ToLower(entry.path().extension().string());
			file.SortKey = entry.path().u8string();
			extensionsFound.insert(file.Extension);
			results.files.push_back(file);
		}
	}
	catch (const fs::filesystem_error &ex)
	{
		results.files.clear();
		results.errorKind = BatchErrorKind::InvalidTarget;
		results.errorMessage = "Cannot list directory " + root.u8string() + ": " + ex.code().message();
		return results;
	}

	if (results.files.empty())
	{
		results.errorKind = BatchErrorKind::EmptySet;
		results.errorMessage = "No files found in the directory: " + root.u8string();
		return results;
	}

	if (extensionsFound.size() != 1)
	{
		std::vector<std::string> shown;
		for (const auto &ext : extensionsFound)
		{
			shown.push_back(ext.empty() ? "(none)" : ext);
		}
		results.files.clear();
		results.errorKind = BatchErrorKind::MixedExtensions;
		results.errorMessage = "Mixed file extensions in the directory: " + JoinList(shown, ", ");
		return results;
	}

	const std::string ext = *extensionsFound.begin();
	std::vector<std::string> allowed;
	for (const auto &candidate : allowedExtensions)
	{
		allowed.push_back(NormaliseExtension(candidate));
	}
	if (ext.empty() || std::find(allowed.begin(), allowed.end(), ext) == allowed.end())
	{
		results.files.clear();
		results.errorKind = BatchErrorKind::DisallowedExtension;
		results.errorMessage = "Extension not allowed: " + (ext.empty() ? std::string("(none)") : ext) + ". Allowed: " + JoinList(allowed, ", ");
		return results;
	}

	std::sort(results.files.begin(), results.files.end(),
			  [](const FileEntry &a, const FileEntry &b)
			  {
				  return NaturalLess(a.SortKey, b.SortKey);
			  });

	results.extension = ext;
	results.success = true;
	wxLogVerbose("Discovered %d '%s' file(s) in %s", (int)results.files.size(), ext.c_str(), root.string().c_str());
	return results;
}
