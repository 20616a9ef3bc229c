/**
 * @file output_map.cpp
 * @ingroup ssdet_engine
 * @brief Name and positional matching of graph outputs to feature layers.
 */

#include "engine/output_map.h"

#include <algorithm>
#include <cctype>
#include <exception>
#include <initializer_list>
#include <new>
#include <utility>

namespace ssdet::engine {

namespace {

/// Position of @p token in @p name where it is not followed by a digit, or npos.
std::size_t find_token_(const std::string& name, const std::string& token) {
    std::size_t pos = name.find(token);
    while (pos != std::string::npos) {
        const std::size_t end = pos + token.size();
        if (end >= name.size() || !std::isdigit((unsigned char)name[end])) return pos;
        pos = name.find(token, pos + 1);
    }
    return std::string::npos;
}

bool has_any_(const std::string& s, std::initializer_list<const char*> tokens) {
    for (const char* t : tokens)
        if (s.find(t) != std::string::npos) return true;
    return false;
}

/// Index of the first output naming @p layer with one of @p kinds outside the layer token, or -1.
int find_by_(const std::vector<std::string>& names, const std::string& layer, std::initializer_list<const char*> kinds) {
    for (std::size_t i = 0; i < names.size(); ++i) {
        const std::size_t pos = find_token_(names[i], layer);
        if (pos == std::string::npos) continue;
        // "block4_cls" holds "loc" inside "block"; only the remainder counts.
        std::string rest = names[i];
        rest.erase(pos, layer.size());
        if (has_any_(rest, kinds)) return (int)i;
    }
    return -1;
}

} // namespace

Result<OutputMap> map_outputs(const std::vector<std::string>& out_names,
                              const std::vector<std::string>& feat_layers) noexcept {
    using R = Result<OutputMap>;
    const std::size_t L = feat_layers.size();
    if (L == 0) return R::Err(Status::Invalid("map_outputs: no feature layers"));

    try {
        OutputMap m;
        m.cls.assign(L, -1);
        m.loc.assign(L, -1);

        bool resolved = true;
        for (std::size_t l = 0; l < L && resolved; ++l) {
            if (feat_layers[l].empty()) {
                resolved = false;
                break;
            }
            m.loc[l] = find_by_(out_names, feat_layers[l], {"loc", "box", "reg"});
            m.cls[l] = find_by_(out_names, feat_layers[l], {"cls", "conf", "logit", "score"});
            if (m.loc[l] < 0 || m.cls[l] < 0 || m.loc[l] == m.cls[l]) resolved = false;
        }

        if (!resolved) {
            if (out_names.size() < 2 * L) {
                return R::Err(Status::Unsupported("map_outputs: graph has " + std::to_string(out_names.size()) +
                                                  " outputs, need at least " + std::to_string(2 * L) +
                                                  " (cls + loc per layer)"));
            }
            for (std::size_t l = 0; l < L; ++l) {
                m.cls[l] = (int)l;
                m.loc[l] = (int)(L + l);
            }
        }
        m.by_name = resolved;

        for (int i = 0; i < (int)out_names.size(); ++i) {
            const bool used = std::find(m.cls.begin(), m.cls.end(), i) != m.cls.end() ||
                              std::find(m.loc.begin(), m.loc.end(), i) != m.loc.end();
            if (!used) m.extra.push_back(i);
        }
        return R::Ok(std::move(m));
    } catch (const std::bad_alloc&) {
        return R::Err(Status::OutOfMemory("map_outputs: bad_alloc"));
    } catch (const std::exception& e) {
        return R::Err(Status::Internal(std::string("map_outputs: ") + e.what()));
    }
}

bool is_channels_first(const std::vector<int64_t>& shape, int64_t expected_channels) noexcept {
    if (shape.size() != 4) return false;
    return expected_channels > 0 ? shape[1] == expected_channels : true;
}

} // namespace ssdet::engine
