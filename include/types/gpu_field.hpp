#pragma once

#include <cstddef>
#include <type_traits>

#include "types/b_field_element.hpp"
#include "types/x_field_element.hpp"

namespace gpu_poly {

/**
 * GpuField<F> ties a host field type to its compiled GPU kernel variants.
 *
 * name()        - suffix of every kernel identifier for this field
 * element_bytes - size of one element in a device buffer
 * Base          - field of twiddles, scale factors and MulPow bases
 *
 * Stages are templated on F, so a stage can only ever bind buffers of the
 * field its pipeline was compiled for.
 */
template<typename F>
struct GpuField;

template<>
struct GpuField<BFieldElement> {
    using Base = BFieldElement;
    static constexpr const char* name() { return "p18446744069414584321"; }
    static constexpr size_t element_bytes = 8;
};

template<>
struct GpuField<XFieldElement> {
    using Base = BFieldElement;
    static constexpr const char* name() { return "p18446744069414584321_fq3"; }
    static constexpr size_t element_bytes = 24;
};

static_assert(std::is_trivially_copyable<BFieldElement>::value, "BFieldElement must be trivially copyable");
static_assert(std::is_trivially_copyable<XFieldElement>::value, "XFieldElement must be trivially copyable");
static_assert(sizeof(BFieldElement) == GpuField<BFieldElement>::element_bytes, "BFieldElement layout");
static_assert(sizeof(XFieldElement) == GpuField<XFieldElement>::element_bytes, "XFieldElement layout");

} // namespace gpu_poly
