#ifndef DEFINITIONS_H
#define DEFINITIONS_H

#include <string>
#include <vector>

namespace Definitions {

// --- Application ---
const std::string APP_NAME = "webp-convert";
const std::string APP_TITLE = "WebP Image Converter";

// --- Image manipulation ---

// Extensions (lowercase, with dot) accepted as conversion sources.
const std::vector<std::string> SOURCE_IMG_EXTENSIONS = {
    ".webp"
};

const std::string PNG_EXTENSION = ".png";
const std::string JPEG_EXTENSION = ".jpg";

// Near-lossless JPEG by default
const int DEFAULT_JPEG_QUALITY = 95;
const int DEFAULT_PNG_COMPRESSION = 6;

// --- Naming ---
const std::string DEFAULT_PREFIX = "image";
const int DEFAULT_START_NUMBER = 1;
const int SEQUENCE_PAD_WIDTH = 3;
// Largest start number; nine digits keeps the running counter inside int
const int MAX_START_NUMBER = 999999999;

// Folder created beside the executable by --create-converted
const std::string CONVERTED_DIR_NAME = "converted";

} // namespace Definitions

#endif // DEFINITIONS_H
