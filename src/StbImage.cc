// Single translation unit that compiles the stb_image / stb_image_write
// implementations used by ImageIO.
#define STB_IMAGE_IMPLEMENTATION
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include "stb/stb_image.h"
#include "stb/stb_image_write.h"
