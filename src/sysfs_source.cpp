// cppcheck-suppress-file missingIncludeSystem
#include "sysfs_source.hpp"

#include <utility>

#include "label_format.hpp"
#include "logging.hpp"
#include "tracing.hpp"

namespace sysattr {

SysfsSource::SysfsSource() = default;

SysfsSource::SysfsSource(SysfsConfig config) : config_(std::move(config)) {}

SysfsRoot SysfsSource::root() const
{
    if (!config_.sysfs_root.empty()) {
        return SysfsRoot(config_.sysfs_root);
    }
    return SysfsRoot::from_env();
}

Result<void> SysfsSource::discover()
{
    ScopedSpan span("sysfs.discover", make_span_id("trace-discover"));

    Features next;
    auto& elements = next.attributes[kAttributeFeature].elements;
    const SysfsRoot sysfs_root = root();
    size_t skipped = 0;

    for (const auto& entry : config_.whitelist) {
        const std::string attr = logical_attribute_path(entry);
        const std::string real_path = sysfs_root.path(attr);

        auto content = read_attribute(real_path);
        if (!content) {
            ++skipped;
            if (content.error().code() == ErrorCode::ResourceNotFound) {
                logger().log(SLOG_DEBUG("Sysfs attribute not present")
                                 .field("parameter", attr)
                                 .field("path", real_path));
            } else {
                logger().log(SLOG_WARN("Reading sysfs attribute failed")
                                 .field("parameter", attr)
                                 .field("error", content.error().to_string())
                                 .field("code", error_code_name(content.error().code())));
            }
            continue;
        }

        // Later entries that map to the same name overwrite earlier ones.
        elements[build_attribute_name(attr, config_.max_name_length)] = sanitize_label_value(*content);
    }

    const size_t recorded = elements.size();
    features_ = std::move(next);

    logger().log(SLOG_DEBUG("Sysfs discovery complete")
                     .field("root", sysfs_root.root())
                     .field("whitelist", static_cast<int64_t>(config_.whitelist.size()))
                     .field("attributes", static_cast<int64_t>(recorded))
                     .field("skipped", static_cast<int64_t>(skipped)));
    return {};
}

Labels SysfsSource::labels() const
{
    Labels out;
    auto it = features_.attributes.find(kAttributeFeature);
    if (it == features_.attributes.end()) {
        return out;
    }
    for (const auto& [key, value] : it->second.elements) {
        out[sanitize_label_key(key)] = sanitize_label_key(value);
    }
    return out;
}

std::unique_ptr<SourceConfig> SysfsSource::new_config() const
{
    return std::make_unique<SysfsConfig>();
}

Result<void> SysfsSource::set_config(const SourceConfig& conf)
{
    const auto* sysfs_conf = dynamic_cast<const SysfsConfig*>(&conf);
    if (sysfs_conf == nullptr) {
        return Error(ErrorCode::ConfigTypeMismatch, "Invalid config type for source", kSourceName);
    }
    config_ = *sysfs_conf;
    return {};
}

} // namespace sysattr
