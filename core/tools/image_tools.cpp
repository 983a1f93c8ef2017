#include "tools/image_tools.hpp"
#include "util/errors.hpp"
#include "util/logger.hpp"

namespace wrc {

void cleanupQuietly(ImageTools& tools, const WorkingFileSet& files, Logger& logger) {
    try {
        tools.cleanup(files);
    } catch (const RecompressError& e) {
        logger.warn(std::string("Couldn't clean up working files: ") + e.what());
    }
}

} // namespace wrc
