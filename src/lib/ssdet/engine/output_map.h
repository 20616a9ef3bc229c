/**
 * @file output_map.h
 * @ingroup ssdet_engine
 * @brief Assignment of graph outputs to configured feature layers, and layout detection.
 *
 * @details
 * Independent of ORT so that the mapping rules can be exercised without a model:
 * 1) by name: an output matches layer @c l when its name contains @c feat_layers[l] as a token
 *    (not followed by a digit, so "block1" does not match "block10_loc") and the rest of the
 *    name carries a location token ("loc", "box", "reg") or a class token
 *    ("cls", "conf", "logit", "score");
 * 2) positional fallback, used when (1) leaves any layer unresolved:
 *    [cls_0 .. cls_{L-1}, loc_0 .. loc_{L-1}], requires at least 2*L outputs.
 * Outputs consumed by no layer are reported in @ref ssdet::engine::OutputMap::extra.
 *
 * @note Internal header; not part of the installed API.
 */

#pragma once

#include "status.h"

#include <cstdint>
#include <string>
#include <vector>

namespace ssdet::engine {

struct OutputMap {
    /// Output index per layer, same order as the configured layer list.
    std::vector<int> cls;
    std::vector<int> loc;

    /// Outputs not consumed by a head.
    std::vector<int> extra;

    /// False when the positional fallback was used.
    bool by_name = false;
};

/**
 * @brief Maps @p out_names onto @p feat_layers.
 *
 * @retval Status::InvalidArgument if @p feat_layers is empty.
 * @retval Status::Unsupported if name matching fails and there are fewer than 2*L outputs.
 */
Result<OutputMap> map_outputs(const std::vector<std::string>& out_names,
                              const std::vector<std::string>& feat_layers) noexcept;

/**
 * @brief Whether a rank-4 output is laid out [B,C,H,W].
 *
 * Channels-first when dim 1 equals @p expected_channels; an unknown channel count
 * (@p expected_channels <= 0) also reads as channels-first, the ONNX default.
 * Shapes of other ranks return false.
 */
bool is_channels_first(const std::vector<int64_t>& shape, int64_t expected_channels) noexcept;

} // namespace ssdet::engine
