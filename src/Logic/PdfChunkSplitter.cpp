#include "PdfChunkSplitter.h"

#include <qpdf/QPDF.hh>
#include <qpdf/QPDFExc.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <qpdf/QPDFWriter.hh>

#include <wx/log.h>

#include <algorithm>
#include <filesystem>
#include <regex>
#include <string>
#include <system_error> // For std::error_code
#include <stdexcept>
#include <vector>

namespace
{
	void Fail(SplitResult &results, const std::string &message)
	{
		results.success = false;
		results.errorKind = BatchErrorKind::SplitFailure;
		results.errorMessage = message;
	}

	void LogWarnings(QPDF &pdf, const fs::path &path)
	{
		for (const QPDFExc &warning : pdf.getWarnings())
		{
			wxLogVerbose("%s: %s", path.filename().string().c_str(), warning.what());
		}
	}

	void WriteChunk(QPDF &source, const std::vector<QPDFPageObjectHelper> &pages, std::size_t first, std::size_t count, const fs::path &chunkPath)
	{
		QPDF chunk;
		chunk.emptyPDF();
		chunk.setSuppressWarnings(true);
		QPDFPageDocumentHelper chunkPages(chunk);
		for (std::size_t i = first; i < first + count; ++i)
		{
			chunkPages.addPage(pages[i], false);
		}

		QPDFWriter writer(chunk, chunkPath.u8string().c_str());
		writer.setMinimumPDFVersion(source.getPDFVersion());
		writer.write();
	}
}

// Removes split_N files left by an earlier run so the folder holds only this run's chunks
bool PdfChunkSplitter::RemoveStaleChunks(const fs::path &outputDirectory, const std::string &extension, std::string &errorMessage)
{
	const std::regex chunkPattern("split_[0-9]+");
	const std::string normalised = BatchRenamerLogic::NormaliseExtension(extension);

	std::error_code ec;
	if (!fs::is_directory(outputDirectory, ec))
		return true;

	std::vector<fs::path> stale;
	for (const auto &entry : fs::directory_iterator(outputDirectory, ec))
	{
		if (!entry.is_regular_file(ec))
			continue;
		const fs::path &path = entry.path();
		if (BatchRenamerLogic::NormaliseExtension(path.extension().string()) == normalised &&
			std::regex_match(path.stem().string(), chunkPattern))
		{
			stale.push_back(path);
		}
	}
	if (ec)
	{
		errorMessage = "Cannot read output folder " + outputDirectory.u8string() + ": " + ec.message();
		return false;
	}

	for (const auto &path : stale)
	{
		if (!fs::remove(path, ec) || ec)
		{
			errorMessage = "Cannot remove previous chunk " + path.u8string() + ": " + ec.message();
			return false;
		}
		wxLogVerbose("Removed previous chunk %s", path.string().c_str());
	}
	return true;
}

// Writes consecutive runs of pagesPerChunk pages to outputDirectory/split_N.pdf
SplitResult PdfChunkSplitter::split(const fs::path &sourceFile, const fs::path &outputDirectory, int pagesPerChunk)
{
	SplitResult results;

	if (pagesPerChunk < 1)
	{
		Fail(results, "Pages per chunk must be at least 1 (got " + std::to_string(pagesPerChunk) + ").");
		return results;
	}

	try
	{
		std::error_code ec;
		if (!fs::is_regular_file(sourceFile, ec) || ec)
		{
			Fail(results, "Source file not found: " + sourceFile.u8string());
			return results;
		}

		QPDF source;
		source.setSuppressWarnings(true);
		source.processFile(sourceFile.u8string().c_str());
		LogWarnings(source, sourceFile);
		if (source.isEncrypted())
		{
			Fail(results, "Encrypted PDF files cannot be split: " + sourceFile.u8string());
			return results;
		}

		// Resources, MediaBox, CropBox and Rotate move from the page tree onto each page
		source.pushInheritedAttributesToPage();
		const std::vector<QPDFPageObjectHelper> pages = QPDFPageDocumentHelper(source).getAllPages();
		results.pageCount = pages.size();
		if (pages.empty())
		{
			Fail(results, "The PDF file has no pages: " + sourceFile.u8string());
			return results;
		}

		fs::create_directories(outputDirectory, ec);
		if (ec)
		{
			Fail(results, "Cannot create output folder " + outputDirectory.u8string() + ": " + ec.message());
			return results;
		}
		std::string error;
		if (!RemoveStaleChunks(outputDirectory, sourceFile.extension().string(), error))
		{
			Fail(results, error);
			return results;
		}

		const std::size_t chunkSize = static_cast<std::size_t>(pagesPerChunk);
		std::size_t chunkIndex = 1;
		for (std::size_t first = 0; first < results.pageCount; first += chunkSize, ++chunkIndex)
		{
			const std::size_t count = std::min(chunkSize, results.pageCount - first);
			const fs::path chunkPath = outputDirectory / ChunkFileName(chunkIndex, sourceFile.extension().string());
			WriteChunk(source, pages, first, count, chunkPath);
			wxLogVerbose("Wrote %s (%d page(s))", chunkPath.string().c_str(), (int)count);
			results.chunkFiles.push_back(chunkPath);
		}
	}
	catch (const QPDFExc &ex)
	{
		if (ex.getErrorCode() == qpdf_e_password)
			Fail(results, "Encrypted PDF files cannot be split: " + sourceFile.u8string());
		else
			Fail(results, "Invalid PDF file: " + std::string(ex.what()));
		return results;
	}
	catch (const fs::filesystem_error &ex)
	{
		Fail(results, "Filesystem Exception: " + std::string(ex.what()));
		return results;
	}
	catch (const std::exception &ex)
	{
		Fail(results, "General Exception: " + std::string(ex.what()));
		return results;
	}

	results.success = true;
	wxLogMessage("Split %s into %d file(s) in %s", sourceFile.filename().string().c_str(), (int)results.chunkFiles.size(), outputDirectory.string().c_str());
	return results;
}
