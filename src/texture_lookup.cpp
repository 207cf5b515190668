#include <texture_lookup.h>

namespace prt {

TextureLookup::~TextureLookup() = default;

}
