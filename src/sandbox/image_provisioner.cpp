#include "sandbox/image_provisioner.hpp"

#include "utils/logging.hpp"

namespace boxrun::sandbox {

ImageProvisioner::ImageProvisioner(runtime::ContainerRuntime& runtime)
    : runtime_(runtime) {}

void ImageProvisioner::Ensure(const std::set<std::string>& images) const {
    for (const auto& image : images) {
        utils::LogInfo("images", "pulling image", {{"image", image}});
        try {
            runtime_.PullImage(image);
            utils::LogInfo("images", "pulled image", {{"image", image}});
        } catch (const runtime::RuntimeError& ex) {
            utils::LogWarn("images", "failed to pull image", {
                {"image", image},
                {"kind", runtime::ToString(ex.kind())},
                {"error", ex.what()}
            });
        }
    }
}

}  // namespace boxrun::sandbox
