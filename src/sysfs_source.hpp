// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <memory>
#include <string>

#include "attribute_path.hpp"
#include "config.hpp"
#include "feature_source.hpp"

namespace sysattr {

/**
 * Discovery session for whitelisted sysfs attributes.
 *
 * Each whitelist entry is resolved under the sysfs root, read, and recorded
 * as <dotted path name> -> <sanitized content> in the "attribute" feature.
 * Entries that cannot be read are logged and skipped; they never fail the run.
 */
class SysfsSource : public FeatureSource, public LabelSource, public ConfigurableSource {
  public:
    SysfsSource();
    explicit SysfsSource(SysfsConfig config);

    [[nodiscard]] const char* name() const override { return kSourceName; }
    Result<void> discover() override;
    [[nodiscard]] const Features& features() const override { return features_; }

    [[nodiscard]] int priority() const override { return 0; }
    [[nodiscard]] Labels labels() const override;

    [[nodiscard]] std::unique_ptr<SourceConfig> new_config() const override;
    [[nodiscard]] const SourceConfig& config() const override { return config_; }
    Result<void> set_config(const SourceConfig& conf) override;

    [[nodiscard]] const SysfsConfig& sysfs_config() const { return config_; }
    [[nodiscard]] SysfsRoot root() const;

  private:
    SysfsConfig config_;
    Features features_;
};

} // namespace sysattr
