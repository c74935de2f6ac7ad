#pragma once

// ============================================================================
// PackedMeshBuilder - Flat-buffer ribbon kernel
// ============================================================================
// Same algorithm as RibbonMeshBuilder, written over packed arrays with a
// single pre-sized output allocation. No Qt value types in the inner loops,
// which keeps it cheap to run on MeshWorkerPool threads.
// ============================================================================

#include "MeshBuilder.h"

class PackedMeshBuilder : public MeshBuilder {
public:
    QVector<float> build(const MeshInput& input) const override;

    Kind kind() const override { return Kind::Packed; }
    const char* name() const override { return "packed"; }
};
