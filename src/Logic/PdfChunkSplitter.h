#ifndef PDFCHUNKSPLITTER_H
#define PDFCHUNKSPLITTER_H

#include "ChunkSplitter.h"

#include <string>

// Page extraction is done by qpdf, which also resolves incremental updates,
// cross-reference streams and object streams in the source.
class PdfChunkSplitter : public ChunkSplitter
{
public:
	SplitResult split(const fs::path &sourceFile, const fs::path &outputDirectory, int pagesPerChunk) override;

	static bool RemoveStaleChunks(const fs::path &outputDirectory, const std::string &extension, std::string &errorMessage);
};

#endif // PDFCHUNKSPLITTER_H
