// Created by Unium on 12.02.26

#pragma once

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <initializer_list>
#include <random>
#include <string>
#include <vector>

namespace MT {

constexpr int mmDims = 4;

// f32 only, every weight is widened to f32 at load time
class CTensor {
private:
    // <<<s_start(internal)
    // --- internal helpers
    /*---------------------------------------------------------
     * FN: Allocate
     * DESC: allocs aligned memory for the tensor
     * PARMS: vlShape (dim sizes)
     * AUTH: unium (12.02.26 R: 02.03.26)
     *-------------------------------------------------------*/
    void Allocate(const std::vector<int64_t> &vlShape);

    /*---------------------------------------------------------
     * FN: ComputeStrides
     * DESC: computes row major strides from current shape
     * PARMS: none
     * AUTH: unium (12.02.26)
     *-------------------------------------------------------*/
    void ComputeStrides();
    // >>>s_end(internal)

public:
    // <<<v_start(metadata)
    int m_iNdim;
    int64_t m_lShape[mmDims];
    int64_t m_lStride[mmDims];
    // >>>end(metadata)

    // <<<v_start(data)
    float *m_pfData;
    size_t m_iDataSize;
    bool m_bOwnsData;
    // >>>end(data)

    // <<<s_start(constructors)
    // --- constructors/destructors
    /*---------------------------------------------------------
     * FN: CTensor (def)
     * DESC: constructs empty tensor with no data, used as the
     *       "not present" value for optional weights (biases)
     * PARMS: none
     * AUTH: unium (12.02.26)
     *-------------------------------------------------------*/
    CTensor();

    /*---------------------------------------------------------
     * FN: CTensor (initializer_list)
     * DESC: constructs an uninitialized tensor with shape given
     * PARMS: lShape (dim sizes)
     * AUTH: unium (12.02.26 R: 02.03.26)
     *-------------------------------------------------------*/
    CTensor(std::initializer_list<int64_t> lShape);

    /*---------------------------------------------------------
     * FN: CTensor (vector)
     * DESC: constructs an uninitialized tensor with shape vec
     * PARMS: vlShape (dim sizes)
     * AUTH: unium (12.02.26 R: 02.03.26)
     *-------------------------------------------------------*/
    explicit CTensor(const std::vector<int64_t> &vlShape);

    ~CTensor();

    // no copy!! only move!!
    CTensor(const CTensor &) = delete;
    CTensor &operator=(const CTensor &) = delete;

    CTensor(CTensor &&other) noexcept;
    CTensor &operator=(CTensor &&other) noexcept;

    /*---------------------------------------------------------
     * FN: Clone
     * DESC: deep copies the tensor, new tensor owns its data.
     *       views are compacted into a contiguous copy
     * PARMS: none
     * AUTH: unium (12.02.26 R: 02.03.26)
     *-------------------------------------------------------*/
    auto Clone() const -> CTensor;
    // >>>s_end(constructors)

    // <<<s_start(factory)
    // --- factory methods
    static auto Zeros(std::initializer_list<int64_t> lShape) -> CTensor;
    static auto Zeros(const std::vector<int64_t> &vlShape) -> CTensor;
    static auto Fill(std::initializer_list<int64_t> lShape, float fVal) -> CTensor;
    static auto Fill(const std::vector<int64_t> &vlShape, float fVal) -> CTensor;

    /*---------------------------------------------------------
     * FN: RandNormal
     * DESC: creates a tensor of N(0, fStd) samples truncated to
     *       +-2 std (resampled), drawn from the caller's rng so
     *       a model built twice from one seed is identical
     * PARMS: vlShape (dims), fStd (std dev), rng (generator)
     * AUTH: unium (03.03.26)
     *-------------------------------------------------------*/
    static auto RandNormal(const std::vector<int64_t> &vlShape, float fStd, std::mt19937 &rng) -> CTensor;
    // >>>s_end(factory)

    // <<<s_start(element)
    // --- element access
    auto lNumel() const -> int64_t;
    auto bEmpty() const -> bool { return m_iNdim == 0 || m_pfData == nullptr; }

    // rows = dim 0, cols = product of the rest
    auto lRows() const -> int64_t;
    auto lCols() const -> int64_t;

    auto fAt(std::initializer_list<int64_t> lIndices) -> float &;
    auto fAt(std::initializer_list<int64_t> lIndices) const -> float;
    auto fFlat(int64_t lIdx) -> float &;
    auto fFlat(int64_t lIdx) const -> float;

    auto pfData() -> float * { return m_pfData; }
    auto pfData() const -> const float * { return m_pfData; }

    /*---------------------------------------------------------
     * FN: pfRow
     * DESC: pointer to the first element of row lRow, tensor
     *       must be contiguous
     * PARMS: lRow (row index)
     * AUTH: unium (03.03.26)
     *-------------------------------------------------------*/
    auto pfRow(int64_t lRow) -> float *;
    auto pfRow(int64_t lRow) const -> const float *;
    // >>>s_end(element)

    // <<<s_start(shape_manip)
    // --- shape manipulation
    auto bIsContiguous() const -> bool;

    auto vlShape() const -> std::vector<int64_t>;
    auto bSameShape(const std::vector<int64_t> &vlOther) const -> bool;
    // >>>s_end(shape_manip)

    // <<<s_start(utils)
    // --- shape formatting
    /*---------------------------------------------------------
     * FN: szShape
     * DESC: formats the shape as "[a, b]" for log lines and
     *       error messages
     * PARMS: none
     * AUTH: unium (03.03.26)
     *-------------------------------------------------------*/
    auto szShape() const -> std::string;
    // >>>s_end(utils)
};

/*---------------------------------------------------------
 * FN: szShapeOf
 * DESC: formats a shape vector the same way CTensor::szShape
 *       does
 * PARMS: vlShape (dims)
 * AUTH: unium (03.03.26)
 *-------------------------------------------------------*/
auto szShapeOf(const std::vector<int64_t> &vlShape) -> std::string;
} // namespace MT
