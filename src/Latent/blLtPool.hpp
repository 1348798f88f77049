// Created by Unium on 09.03.26

#pragma once

#include "../Tensor/mtTnTnsr.hpp"
#include "../Util/utUtErr_.hpp"
#include "blLtConf.hpp"
#include <cstdint>
#include <vector>

namespace BL {
/*---------------------------------------------------------
 * FN: CPatchAggregator
 * DESC: pools byte representations into one vector per patch.
 *       mean averages the span, last takes its final row, max
 *       is elementwise. a trailing partial patch is pooled the
 *       same way as the rest
 * AUTH: unium (09.03.26)
 *-------------------------------------------------------*/
class CPatchAggregator {
public:
    explicit CPatchAggregator(EPoolMode eMode = EPoolMode::Mean) : m_eMode(eMode) {}

    /*---------------------------------------------------------
     * FN: bPool
     * DESC: reps [L, d] + boundaries -> [P, d]. L = 0 (bounds
     *       [0]) gives an empty tensor
     * PARMS: tReps (byte reps), vlBounds (patch offsets),
     *        tOut (patches out), sErr (status)
     * AUTH: unium (09.03.26)
     *-------------------------------------------------------*/
    auto bPool(const MT::CTensor &tReps, const std::vector<int64_t> &vlBounds, MT::CTensor &tOut,
               UT::SError &sErr) const -> bool;

    auto eMode() const -> EPoolMode { return m_eMode; }

private:
    EPoolMode m_eMode;
};
} // namespace BL
