#include "ChunkSplitter.h"

#include <string>

std::string ChunkSplitter::ChunkFileName(std::size_t chunkIndex, const std::string &extension)
{
	return "split_" + std::to_string(chunkIndex) + BatchRenamerLogic::NormaliseExtension(extension);
}
