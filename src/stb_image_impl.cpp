// =============================================================================
// Tapdeck - stb_image implementation unit
// =============================================================================
// Owns STB_IMAGE_IMPLEMENTATION to avoid duplicate definitions.
// =============================================================================
#define STB_IMAGE_IMPLEMENTATION
#define STBI_ONLY_PNG
#define STBI_ONLY_JPEG
#define STBI_ONLY_BMP
#include "stb_image.h"
