/**
 * @file anchor_generator.cpp
 * @ingroup ssdet_anchor
 * @brief Anchor grid and size generation.
 */

#include "anchor/anchor_generator.h"

#include <cmath>
#include <exception>
#include <new>
#include <string>
#include <utility>

namespace ssdet::anchor {

Result<LayerAnchors> generate_layer(const ImageShape& img_shape, const FeatShape& feat_shape,
                                    const std::vector<float>& sizes, const std::vector<float>& ratios, float step,
                                    float offset) noexcept {
    using R = Result<LayerAnchors>;

    if (img_shape.h <= 0 || img_shape.w <= 0) return R::Err(Status::Invalid("generate_layer: img_shape must be > 0"));
    if (feat_shape.h <= 0 || feat_shape.w <= 0)
        return R::Err(Status::Invalid("generate_layer: feat_shape must be known and > 0"));
    if (sizes.empty() || sizes.size() > 2)
        return R::Err(Status::Invalid("generate_layer: expected 1 or 2 sizes, got " + std::to_string(sizes.size())));
    for (float s : sizes)
        if (!(s > 0.f)) return R::Err(Status::Invalid("generate_layer: sizes must be > 0"));
    for (float r : ratios)
        if (!(r > 0.f)) return R::Err(Status::Invalid("generate_layer: ratios must be > 0"));
    if (!(step > 0.f)) return R::Err(Status::Invalid("generate_layer: step must be > 0"));

    try {
        LayerAnchors a;
        a.H = static_cast<int>(feat_shape.h);
        a.W = static_cast<int>(feat_shape.w);

        const double img_h = static_cast<double>(img_shape.h);
        const double img_w = static_cast<double>(img_shape.w);

        const std::size_t cells = (std::size_t)a.H * (std::size_t)a.W;
        a.cy.resize(cells);
        a.cx.resize(cells);

        const int H = a.H;
        const int W = a.W;
#pragma omp parallel for schedule(static) if (cells > 4096)
        for (int i = 0; i < H; ++i) {
            const float y = static_cast<float>((i + (double)offset) * step / img_h);
            for (int j = 0; j < W; ++j) {
                const std::size_t idx = (std::size_t)i * (std::size_t)W + (std::size_t)j;
                a.cy[idx] = y;
                a.cx[idx] = static_cast<float>((j + (double)offset) * step / img_w);
            }
        }

        const std::size_t K = sizes.size() + ratios.size();
        a.h.reserve(K);
        a.w.reserve(K);

        const double s0 = sizes[0];
        a.h.push_back(static_cast<float>(s0 / img_h));
        a.w.push_back(static_cast<float>(s0 / img_w));

        if (sizes.size() > 1) {
            const double s01 = std::sqrt(s0 * (double)sizes[1]);
            a.h.push_back(static_cast<float>(s01 / img_h));
            a.w.push_back(static_cast<float>(s01 / img_w));
        }

        for (float r : ratios) {
            const double sr = std::sqrt((double)r);
            a.h.push_back(static_cast<float>(s0 / img_h / sr));
            a.w.push_back(static_cast<float>(s0 / img_w * sr));
        }

        return R::Ok(std::move(a));
    } catch (const std::bad_alloc&) {
        return R::Err(Status::OutOfMemory("generate_layer: bad_alloc"));
    } catch (const std::exception& e) {
        return R::Err(Status::Internal(std::string("generate_layer: ") + e.what()));
    }
}

Result<AnchorSet> generate_all_layers(const ImageShape& img_shape, const NetConfig& cfg) noexcept {
    using R = Result<AnchorSet>;

    const Status vs = cfg.validate();
    if (!vs.ok()) return R::Err(vs);

    try {
        AnchorSet out;
        out.reserve(cfg.num_layers());
        for (std::size_t i = 0; i < cfg.num_layers(); ++i) {
            auto r = generate_layer(img_shape, cfg.feat_shapes[i], cfg.anchor_sizes[i], cfg.anchor_ratios[i],
                                    cfg.anchor_steps[i], cfg.anchor_offset);
            if (!r.ok()) {
                return R::Err(Status{r.status().code, "layer '" + cfg.feat_layers[i] + "': " + r.status().message});
            }
            out.push_back(std::move(r).value());
        }
        return R::Ok(std::move(out));
    } catch (const std::bad_alloc&) {
        return R::Err(Status::OutOfMemory("generate_all_layers: bad_alloc"));
    }
}

Result<std::vector<std::vector<float>>> size_bounds_to_absolute(const std::array<double, 2>& relative_bounds,
                                                                int num_layers, const ImageShape& img_shape) noexcept {
    using R = Result<std::vector<std::vector<float>>>;

    if (!img_shape.square()) {
        return R::Err(Status::Invalid("size_bounds_to_absolute: img_shape must be square, got " +
                                      std::to_string(img_shape.h) + "x" + std::to_string(img_shape.w)));
    }
    if (num_layers <= 2) return R::Err(Status::Invalid("size_bounds_to_absolute: num_layers must be > 2"));

    const double img_size = static_cast<double>(img_shape.h);

    // Truncation, not rounding: 0.15 -> 15, 0.9 -> 90.
    const int min_pct = static_cast<int>(relative_bounds[0] * 100.0);
    const int max_pct = static_cast<int>(relative_bounds[1] * 100.0);
    if (max_pct < min_pct) return R::Err(Status::Invalid("size_bounds_to_absolute: bounds must be increasing"));

    const int step = static_cast<int>(std::floor((double)(max_pct - min_pct) / (double)(num_layers - 2)));
    if (step <= 0) return R::Err(Status::Invalid("size_bounds_to_absolute: size bounds too close for num_layers"));

    try {
        std::vector<std::vector<float>> sizes;
        sizes.reserve((std::size_t)num_layers);

        const double bmin = relative_bounds[0];
        sizes.push_back({static_cast<float>(img_size * bmin / 2.0), static_cast<float>(img_size * bmin)});

        for (int pct = min_pct; pct <= max_pct; pct += step) {
            sizes.push_back({static_cast<float>(img_size * pct / 100.0), static_cast<float>(img_size * (pct + step) / 100.0)});
        }
        return R::Ok(std::move(sizes));
    } catch (const std::bad_alloc&) {
        return R::Err(Status::OutOfMemory("size_bounds_to_absolute: bad_alloc"));
    }
}

} // namespace ssdet::anchor
