// Created by Unium on 09.03.26

#include "blLtPool.hpp"
#include "blLtPtch.hpp"
#include <algorithm>

using namespace MT;

namespace BL {

auto CPatchAggregator::bPool(const CTensor &tReps, const std::vector<int64_t> &vlBounds, CTensor &tOut,
                             UT::SError &sErr) const -> bool {
    const int64_t lLen = tReps.bEmpty() ? 0 : tReps.lRows();
    if (!bValidBoundaries(vlBounds, lLen))
        return UT::bFail(sErr, UT::EError::Internal,
                         "patch boundaries do not partition " + std::to_string(lLen) + " positions");

    const int64_t lPatches = (int64_t)vlBounds.size() - 1;
    if (lPatches == 0) {
        tOut = CTensor();
        return true;
    }

    const int64_t lDim = tReps.lCols();
    tOut = CTensor::Zeros({lPatches, lDim});

    for (int64_t p = 0; p < lPatches; p++) {
        const int64_t lBegin = vlBounds[p];
        const int64_t lEnd = vlBounds[p + 1];
        float *pfDst = tOut.pfRow(p);

        switch (m_eMode) {
        case EPoolMode::Mean: {
            for (int64_t r = lBegin; r < lEnd; r++) {
                const float *pfSrc = tReps.pfRow(r);
                for (int64_t d = 0; d < lDim; d++)
                    pfDst[d] += pfSrc[d];
            }
            // singleton spans are copied as is, not divided by 1
            if (lEnd - lBegin > 1) {
                const float fInv = 1.0f / (float)(lEnd - lBegin);
                for (int64_t d = 0; d < lDim; d++)
                    pfDst[d] *= fInv;
            }
            break;
        }
        case EPoolMode::Last: {
            const float *pfSrc = tReps.pfRow(lEnd - 1);
            std::copy(pfSrc, pfSrc + lDim, pfDst);
            break;
        }
        case EPoolMode::Max: {
            const float *pfFirst = tReps.pfRow(lBegin);
            std::copy(pfFirst, pfFirst + lDim, pfDst);
            for (int64_t r = lBegin + 1; r < lEnd; r++) {
                const float *pfSrc = tReps.pfRow(r);
                for (int64_t d = 0; d < lDim; d++)
                    pfDst[d] = std::max(pfDst[d], pfSrc[d]);
            }
            break;
        }
        }
    }
    return true;
}
} // namespace BL
