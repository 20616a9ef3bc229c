/**
 * @file ssd_losses.cpp
 * @ingroup ssdet_loss
 * @brief Positive / hard-negative classification and localisation losses.
 *
 * @details
 * The five per-layer lists are not copied into flat arrays. Each layer is described by a
 * @c LayerView holding raw pointers and its offset in the flat anchor sequence; the flat index
 * of an anchor is offset + local index. Mining needs the whole batch at once (n_neg depends on
 * the global counts), so the pass structure is:
 *  1) masks and counts over every anchor,
 *  2) n_neg from the global counts,
 *  3) exact top-k of the eligible set by background probability,
 *  4) the three sums.
 */

#include "loss/ssd_losses.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <exception>
#include <new>
#include <string>
#include <utility>

namespace ssdet::loss {

namespace {

struct LayerView {
    const float* logits = nullptr;
    const float* loc = nullptr;
    const std::int32_t* cls = nullptr;
    const float* gloc = nullptr;
    const float* gscore = nullptr;
    std::size_t count = 0;  ///< anchors in this layer, B*H*W*K
    std::size_t offset = 0; ///< first flat index
};

std::string shape_str_(const std::vector<int64_t>& s) {
    std::string out = "[";
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (i) out += ",";
        out += std::to_string(s[i]);
    }
    return out + "]";
}

template <class T> bool dense_(const BasicTensor<T>& t) noexcept {
    return t.query().fully_known() && t.data.size() == t.numel();
}

/// Same [B,H,W,K] prefix.
bool same_prefix_(const std::vector<int64_t>& a, const std::vector<int64_t>& b) noexcept {
    if (a.size() < 4 || b.size() < 4) return false;
    return std::equal(a.begin(), a.begin() + 4, b.begin());
}

/// log(sum(exp(v))) for one row of C logits.
inline double log_sum_exp_(const float* v, std::size_t C) noexcept {
    float m = v[0];
    for (std::size_t c = 1; c < C; ++c)
        m = std::max(m, v[c]);
    double s = 0.0;
    for (std::size_t c = 0; c < C; ++c)
        s += std::exp((double)v[c] - (double)m);
    return (double)m + std::log(s);
}

Status check_layer_(std::size_t l, const Tensor& lg, const Tensor& lc, const IntTensor& gc, const Tensor& gl,
                    const Tensor& gs, int64_t& batch, int64_t& classes) {
    const std::string at = "compute_losses: layer " + std::to_string(l) + ": ";

    if (lg.rank() != 5 || !lg.query().range_known(0, 4))
        return Status::Invalid(at + "logits must be [B,H,W,K,C], got " + shape_str_(lg.shape));

    const auto c = lg.query().dim(4);
    if (!c || *c < 2) return Status::Invalid(at + "num_classes cannot be determined from logits " + shape_str_(lg.shape));
    if (classes < 0)
        classes = *c;
    else if (classes != *c)
        return Status::Invalid(at + "num_classes " + std::to_string(*c) + " differs from layer 0 (" +
                               std::to_string(classes) + ")");

    if (lg.shape[0] == 0) return Status::Invalid(at + "batch size is 0");
    if (batch < 0)
        batch = lg.shape[0];
    else if (batch != lg.shape[0])
        return Status::Invalid(at + "batch size " + std::to_string(lg.shape[0]) + " differs from layer 0 (" +
                               std::to_string(batch) + ")");

    if (lc.rank() != 5 || lc.shape[4] != 4 || !same_prefix_(lg.shape, lc.shape))
        return Status::Invalid(at + "localisations " + shape_str_(lc.shape) + " do not match logits " + shape_str_(lg.shape));
    if (gl.rank() != 5 || gl.shape[4] != 4 || !same_prefix_(lg.shape, gl.shape))
        return Status::Invalid(at + "glocalisations " + shape_str_(gl.shape) + " do not match logits " + shape_str_(lg.shape));
    if (gc.rank() != 4 || !same_prefix_(lg.shape, gc.shape))
        return Status::Invalid(at + "gclasses " + shape_str_(gc.shape) + " do not match logits " + shape_str_(lg.shape));
    if (gs.rank() != 4 || !same_prefix_(lg.shape, gs.shape))
        return Status::Invalid(at + "gscores " + shape_str_(gs.shape) + " do not match logits " + shape_str_(lg.shape));

    if (!dense_(lg) || !dense_(lc) || !dense_(gc) || !dense_(gl) || !dense_(gs))
        return Status::Invalid(at + "tensor data size does not match its shape");

    return Status::Ok();
}

} // namespace

Result<LossTerms> compute_losses(const std::vector<Tensor>& logits, const std::vector<Tensor>& localisations,
                                 const std::vector<IntTensor>& gclasses, const std::vector<Tensor>& glocalisations,
                                 const std::vector<Tensor>& gscores, const LossParams& params) noexcept {
    using R = Result<LossTerms>;

    const std::size_t L = logits.size();
    if (L == 0) return R::Err(Status::Invalid("compute_losses: no layers"));
    if (localisations.size() != L || gclasses.size() != L || glocalisations.size() != L || gscores.size() != L) {
        return R::Err(Status::Invalid("compute_losses: per-layer lists differ in length (logits " + std::to_string(L) +
                                      ", localisations " + std::to_string(localisations.size()) + ", gclasses " +
                                      std::to_string(gclasses.size()) + ", glocalisations " +
                                      std::to_string(glocalisations.size()) + ", gscores " +
                                      std::to_string(gscores.size()) + ")"));
    }
    if (!std::isfinite(params.negative_ratio) || params.negative_ratio < 0.f)
        return R::Err(Status::Invalid("compute_losses: negative_ratio must be finite and >= 0"));

    try {
        int64_t batch = -1;
        int64_t classes = -1;
        std::vector<LayerView> views;
        views.reserve(L);
        std::size_t total = 0;

        for (std::size_t l = 0; l < L; ++l) {
            const Status st = check_layer_(l, logits[l], localisations[l], gclasses[l], glocalisations[l], gscores[l],
                                           batch, classes);
            if (!st.ok()) return R::Err(st);

            LayerView v;
            v.logits = logits[l].ptr();
            v.loc = localisations[l].ptr();
            v.cls = gclasses[l].ptr();
            v.gloc = glocalisations[l].ptr();
            v.gscore = gscores[l].ptr();
            v.count = gscores[l].numel();
            v.offset = total;
            total += v.count;
            views.push_back(v);
        }

        const std::size_t C = (std::size_t)classes;

        // 1) Masks and counts.
        std::vector<std::uint8_t> positive(total, 0);
        std::vector<std::size_t> eligible;
        std::int64_t n_pos = 0;

        for (const LayerView& v : views) {
            for (std::size_t i = 0; i < v.count; ++i) {
                const float s = v.gscore[i];
                if (s > params.match_threshold) {
                    const std::int32_t label = v.cls[i];
                    if (label < 0 || (std::size_t)label >= C) {
                        return R::Err(Status::Invalid("compute_losses: positive anchor " + std::to_string(v.offset + i) +
                                                      " has label " + std::to_string(label) + " outside [0," +
                                                      std::to_string(C) + ")"));
                    }
                    positive[v.offset + i] = 1;
                    ++n_pos;
                } else if (s > params.ignore_score) {
                    eligible.push_back(v.offset + i);
                }
            }
        }

        const std::int64_t n_eligible = (std::int64_t)eligible.size();

        // 2) Hard-negative budget.
        // Clamped in double: ratio * n_pos may exceed the int64 range.
        const double wanted = std::floor((double)params.negative_ratio * (double)n_pos) + (double)batch;
        const std::int64_t n_neg = wanted < (double)n_eligible ? (std::int64_t)wanted : n_eligible;

        // Flat index -> (layer, local).
        auto locate = [&](std::size_t flat) -> std::pair<const LayerView*, std::size_t> {
            auto it = std::upper_bound(views.begin(), views.end(), flat,
                                       [](std::size_t f, const LayerView& v) { return f < v.offset; });
            const LayerView* v = &*(it - 1);
            return {v, flat - v->offset};
        };

        // 3) Exact top-k of eligible anchors, lowest background probability first.
        std::vector<double> p_bg(eligible.size());
#pragma omp parallel for schedule(static) if (eligible.size() > 4096)
        for (long long e = 0; e < (long long)eligible.size(); ++e) {
            const auto [v, i] = locate(eligible[(std::size_t)e]);
            const float* row = v->logits + i * C;
            p_bg[(std::size_t)e] = std::exp((double)row[0] - log_sum_exp_(row, C));
        }

        std::vector<std::size_t> order(eligible.size());
        for (std::size_t e = 0; e < order.size(); ++e)
            order[e] = e;
        auto harder = [&](std::size_t a, std::size_t b) {
            if (p_bg[a] != p_bg[b]) return p_bg[a] < p_bg[b];
            return eligible[a] < eligible[b];
        };
        if (n_neg > 0 && n_neg < n_eligible)
            std::nth_element(order.begin(), order.begin() + n_neg, order.end(), harder);

        // 4) Sums.
        double pos_sum = 0.0;
        double loc_sum = 0.0;
        for (const LayerView& v : views) {
            const long long n = (long long)v.count;
#pragma omp parallel for schedule(static) reduction(+ : pos_sum, loc_sum) if (n > 4096)
            for (long long i = 0; i < n; ++i) {
                if (!positive[v.offset + (std::size_t)i]) continue;
                const float* row = v.logits + (std::size_t)i * C;
                pos_sum += log_sum_exp_(row, C) - (double)row[v.cls[i]];

                const float* a = v.loc + (std::size_t)i * 4;
                const float* b = v.gloc + (std::size_t)i * 4;
                double s = 0.0;
                for (int k = 0; k < 4; ++k)
                    s += smooth_l1(a[k] - b[k]);
                loc_sum += s;
            }
        }

        double neg_sum = 0.0;
        for (std::int64_t t = 0; t < n_neg; ++t) {
            const auto [v, i] = locate(eligible[order[(std::size_t)t]]);
            const float* row = v->logits + i * C;
            neg_sum += log_sum_exp_(row, C) - (double)row[0];
        }

        LossTerms out;
        const double inv_b = 1.0 / (double)batch;
        out.positive = (float)(pos_sum * inv_b);
        out.negative = (float)(neg_sum * inv_b);
        out.localization = (float)(loc_sum * (double)params.alpha * inv_b);
        out.stats.n_positives = n_pos;
        out.stats.n_eligible_negatives = n_eligible;
        out.stats.n_negatives = n_neg;
        return R::Ok(out);
    } catch (const std::bad_alloc&) {
        return R::Err(Status::OutOfMemory("compute_losses: bad_alloc"));
    } catch (const std::exception& e) {
        return R::Err(Status::Internal(std::string("compute_losses: ") + e.what()));
    }
}

} // namespace ssdet::loss
