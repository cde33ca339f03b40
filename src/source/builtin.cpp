#include "source/ImageSource.hpp"
#include "source/ShotwellSource.hpp"

namespace pfs::source {

void registerBuiltinSources() {
    ImageSource::registerSource(ShotwellSource::NAME, [](const config::SourceConfig& cfg) -> std::unique_ptr<ImageSource> {
        return std::make_unique<ShotwellSource>(cfg);
    });
}

}
