// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <memory>
#include <string>

#include "config.hpp"
#include "result.hpp"
#include "types.hpp"

namespace sysattr {

// A source of discovered node features.
class FeatureSource {
  public:
    virtual ~FeatureSource() = default;

    [[nodiscard]] virtual const char* name() const = 0;

    // Rebuild the feature set from scratch.
    virtual Result<void> discover() = 0;

    // Features of the last discover(); empty before the first run.
    [[nodiscard]] virtual const Features& features() const = 0;
};

// A source whose features are also published as node labels.
class LabelSource {
  public:
    virtual ~LabelSource() = default;

    [[nodiscard]] virtual int priority() const = 0;
    [[nodiscard]] virtual Labels labels() const = 0;
};

class ConfigurableSource {
  public:
    virtual ~ConfigurableSource() = default;

    [[nodiscard]] virtual std::unique_ptr<SourceConfig> new_config() const = 0;
    [[nodiscard]] virtual const SourceConfig& config() const = 0;

    // Fails with ConfigTypeMismatch when conf is not this source's config type.
    virtual Result<void> set_config(const SourceConfig& conf) = 0;
};

} // namespace sysattr
