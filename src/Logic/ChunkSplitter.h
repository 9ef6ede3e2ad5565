#ifndef CHUNKSPLITTER_H
#define CHUNKSPLITTER_H

#include "BatchRenamerLogic.h"

#include <vector>
#include <string>
#include <filesystem>
#include <cstddef>

namespace fs = std::filesystem;

struct SplitResult
{
	std::vector<fs::path> chunkFiles; // In chunk order: split_1, split_2, ...
	std::size_t pageCount = 0;
	bool success = false;
	BatchErrorKind errorKind = BatchErrorKind::None;
	std::string errorMessage;
};

// Splits one multi-page document into fixed-size chunks named split_{n}{extension}.
// Output already written before a failure is left in place.
class ChunkSplitter
{
public:
	virtual ~ChunkSplitter() = default;

	virtual SplitResult split(const fs::path &sourceFile, const fs::path &outputDirectory, int pagesPerChunk) = 0;

	static std::string ChunkFileName(std::size_t chunkIndex, const std::string &extension);
};

#endif // CHUNKSPLITTER_H
