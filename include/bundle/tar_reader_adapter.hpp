#pragma once

#include "io/io.hpp"

#include <archive.h>

#include <string>

namespace gssa {

int OpenArchiveFromReader(struct archive* ar, IReader& reader);
std::string ArchiveErr(struct archive* ar);

} // namespace gssa
