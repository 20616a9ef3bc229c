/**
 * @file config.cpp
 * @brief NetConfig defaults, validation and description.
 *
 * @details
 * Implements:
 * - @ref ssdet::NetConfig::validate (list alignment and value ranges),
 * - @ref ssdet::NetConfig::ssd300 / @ref ssdet::NetConfig::ssd512 default tables,
 * - @ref ssdet::NetConfig::with_feat_shapes (copy-with-override),
 * - @ref ssdet::describe (console dump through the internal printer).
 */

#include "config.h"

#include "internal/printer.h"

#include <cmath>
#include <ostream>
#include <sstream>
#include <string>
#include <utility>

namespace ssdet {

namespace {

/// @brief "<field> has N entries, expected M" message for list-length mismatches.
std::string count_mismatch_(const char* field, std::size_t got, std::size_t expected) {
    return std::string("NetConfig: ") + field + " has " + std::to_string(got) + " entries, expected " +
           std::to_string(expected) + " (one per feat_layers entry)";
}

template <class T> std::string join_(const std::vector<T>& v) {
    std::ostringstream os;
    os << "[";
    for (std::size_t i = 0; i < v.size(); ++i) {
        if (i) os << ", ";
        os << v[i];
    }
    os << "]";
    return os.str();
}

} // namespace

Status NetConfig::validate() const noexcept {
    if (img_shape.h <= 0 || img_shape.w <= 0) return Status::Invalid("NetConfig: img_shape must be > 0");
    if (num_classes < 2) return Status::Invalid("NetConfig: num_classes must be >= 2 (background + 1)");
    if (no_annotation_label < 0) return Status::Invalid("NetConfig: no_annotation_label must be >= 0");

    const std::size_t n = feat_layers.size();
    if (n == 0) return Status::Invalid("NetConfig: feat_layers is empty");

    if (feat_shapes.size() != n) return Status::Invalid(count_mismatch_("feat_shapes", feat_shapes.size(), n));
    if (anchor_sizes.size() != n) return Status::Invalid(count_mismatch_("anchor_sizes", anchor_sizes.size(), n));
    if (anchor_ratios.size() != n) return Status::Invalid(count_mismatch_("anchor_ratios", anchor_ratios.size(), n));
    if (anchor_steps.size() != n) return Status::Invalid(count_mismatch_("anchor_steps", anchor_steps.size(), n));
    if (normalizations.size() != n)
        return Status::Invalid(count_mismatch_("normalizations", normalizations.size(), n));

    for (std::size_t i = 0; i < n; ++i) {
        const std::string at = " (layer " + std::to_string(i) + " '" + feat_layers[i] + "')";
        if (feat_layers[i].empty()) return Status::Invalid("NetConfig: empty layer name" + at);
        if (feat_shapes[i].h <= 0 || feat_shapes[i].w <= 0)
            return Status::Invalid("NetConfig: feat_shapes must be > 0" + at);

        const auto& sz = anchor_sizes[i];
        if (sz.empty() || sz.size() > 2) return Status::Invalid("NetConfig: anchor_sizes needs 1 or 2 values" + at);
        for (float s : sz)
            if (!(s > 0.f)) return Status::Invalid("NetConfig: anchor_sizes must be > 0" + at);

        for (float r : anchor_ratios[i])
            if (!(r > 0.f)) return Status::Invalid("NetConfig: anchor_ratios must be > 0" + at);

        if (!(anchor_steps[i] > 0.f)) return Status::Invalid("NetConfig: anchor_steps must be > 0" + at);
        if (!std::isfinite(normalizations[i])) return Status::Invalid("NetConfig: normalizations must be finite" + at);
    }

    if (!(anchor_offset >= 0.f && anchor_offset <= 1.f)) return Status::Invalid("NetConfig: anchor_offset must be in [0,1]");
    if (!(anchor_size_bounds[0] > 0.0 && anchor_size_bounds[0] < anchor_size_bounds[1]))
        return Status::Invalid("NetConfig: anchor_size_bounds must satisfy 0 < min < max");

    for (float p : prior_scaling)
        if (!(p > 0.f)) return Status::Invalid("NetConfig: prior_scaling must be > 0");

    return Status::Ok();
}

LayerConfig NetConfig::layer(std::size_t i) const {
    LayerConfig l;
    l.name = feat_layers[i];
    l.shape = feat_shapes[i];
    l.sizes = anchor_sizes[i];
    l.ratios = anchor_ratios[i];
    l.step = anchor_steps[i];
    l.normalization = normalizations[i];
    return l;
}

NetConfig NetConfig::with_feat_shapes(std::vector<FeatShape> shapes) const {
    NetConfig next = *this;
    next.feat_shapes = std::move(shapes);
    return next;
}

NetConfig NetConfig::ssd300() {
    NetConfig c;
    c.img_shape = {300, 300};
    c.num_classes = 21;
    c.no_annotation_label = 21;
    c.feat_layers = {"block4", "block7", "block8", "block9", "block10", "block11"};
    c.feat_shapes = {{38, 38}, {19, 19}, {10, 10}, {5, 5}, {3, 3}, {1, 1}};
    c.anchor_size_bounds = {0.15, 0.90};
    c.anchor_sizes = {{21.f, 45.f}, {45.f, 99.f}, {99.f, 153.f}, {153.f, 207.f}, {207.f, 261.f}, {261.f, 315.f}};
    c.anchor_ratios = {{2.f, .5f},
                       {2.f, .5f, 3.f, 1.f / 3.f},
                       {2.f, .5f, 3.f, 1.f / 3.f},
                       {2.f, .5f, 3.f, 1.f / 3.f},
                       {2.f, .5f},
                       {2.f, .5f}};
    c.anchor_steps = {8.f, 16.f, 32.f, 64.f, 100.f, 300.f};
    c.anchor_offset = 0.5f;
    c.normalizations = {20.f, -1.f, -1.f, -1.f, -1.f, -1.f};
    c.prior_scaling = {0.1f, 0.1f, 0.2f, 0.2f};
    return c;
}

NetConfig NetConfig::ssd512() {
    NetConfig c;
    c.img_shape = {512, 512};
    c.num_classes = 21;
    c.no_annotation_label = 21;
    c.feat_layers = {"block4", "block7", "block8", "block9", "block10", "block11", "block12"};
    c.feat_shapes = {{64, 64}, {32, 32}, {16, 16}, {8, 8}, {4, 4}, {2, 2}, {1, 1}};
    c.anchor_size_bounds = {0.10, 0.90};
    c.anchor_sizes = {{20.48f, 51.2f},    {51.2f, 133.12f},   {133.12f, 215.04f}, {215.04f, 296.96f},
                      {296.96f, 378.88f}, {378.88f, 460.8f},  {460.8f, 542.72f}};
    c.anchor_ratios = {{2.f, .5f},
                       {2.f, .5f, 3.f, 1.f / 3.f},
                       {2.f, .5f, 3.f, 1.f / 3.f},
                       {2.f, .5f, 3.f, 1.f / 3.f},
                       {2.f, .5f, 3.f, 1.f / 3.f},
                       {2.f, .5f},
                       {2.f, .5f}};
    c.anchor_steps = {8.f, 16.f, 32.f, 64.f, 128.f, 256.f, 512.f};
    c.anchor_offset = 0.5f;
    c.normalizations = {20.f, -1.f, -1.f, -1.f, -1.f, -1.f, -1.f};
    c.prior_scaling = {0.1f, 0.1f, 0.2f, 0.2f};
    return c;
}

void describe(const NetConfig& cfg, std::ostream& os, bool color) {
    internal::Printer p{os};
    p.a.enable = color;

    p.section("Network");
    p.kv("img_shape", std::to_string(cfg.img_shape.h) + "x" + std::to_string(cfg.img_shape.w), 2);
    p.kv("num_classes", cfg.num_classes, 2);
    p.kv("no_annotation_label", cfg.no_annotation_label, 2);
    p.kv("anchor_offset", cfg.anchor_offset, 2);
    p.kv("prior_scaling", join_(std::vector<float>(cfg.prior_scaling.begin(), cfg.prior_scaling.end())), 2);
    p.kv_path("model_path", cfg.model_path, 2);
    p.kv_bool("verbose", cfg.verbose, 2);

    p.section("Layers");
    for (std::size_t i = 0; i < cfg.num_layers(); ++i) {
        if (i >= cfg.feat_shapes.size() || i >= cfg.anchor_sizes.size() || i >= cfg.anchor_ratios.size() ||
            i >= cfg.anchor_steps.size() || i >= cfg.normalizations.size()) {
            p.hint("(per-layer lists are misaligned, run validate())", 2);
            break;
        }
        const LayerConfig l = cfg.layer(i);
        p.section(l.name, 2);
        p.kv("shape", std::to_string(l.shape.h) + "x" + std::to_string(l.shape.w), 4);
        p.kv("sizes", join_(l.sizes), 4);
        p.kv("ratios", join_(l.ratios), 4);
        p.kv("step", l.step, 4);
        p.kv("anchors/cell", l.num_anchors(), 4);
        p.kv_bool("l2_normalized", l.normalized(), 4);
    }

    p.section("Runtime");
    p.kv("ort_intra_threads", cfg.runtime.ort_intra_threads, 2);
    p.kv("ort_inter_threads", cfg.runtime.ort_inter_threads, 2);
    p.kv("omp_threads", cfg.runtime.omp_threads, 2);
    p.kv_bool("suppress_opencv", cfg.runtime.suppress_opencv, 2);
}

} // namespace ssdet
