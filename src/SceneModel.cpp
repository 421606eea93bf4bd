#include "SceneModel.h"

#include <algorithm>
#include <cmath>
#include <utility>

const char* objectKindName(ObjectKind kind)
{
    switch (kind) {
    case ObjectKind::Mesh:     return "MESH";
    case ObjectKind::Skeleton: return "ARMATURE";
    case ObjectKind::Other:    return "OTHER";
    }
    return "OTHER";
}

const char* interactionModeName(InteractionMode mode)
{
    switch (mode) {
    case InteractionMode::Object:      return "OBJECT";
    case InteractionMode::Edit:        return "EDIT";
    case InteractionMode::Pose:        return "POSE";
    case InteractionMode::WeightPaint: return "PAINT_WEIGHT";
    case InteractionMode::Other:       return "OTHER";
    }
    return "OTHER";
}

// ============================================================================
// Matrix44
// ============================================================================

Matrix44 Matrix44::identity()
{
    Matrix44 r = {};
    r.m[0] = r.m[5] = r.m[10] = r.m[15] = 1.0;
    return r;
}

Matrix44 multiply(const Matrix44& a, const Matrix44& b)
{
    Matrix44 r = {};
    for (int row = 0; row < 4; ++row) {
        for (int col = 0; col < 4; ++col) {
            double sum = 0.0;
            for (int k = 0; k < 4; ++k) {
                sum += a.m[row * 4 + k] * b.m[k * 4 + col];
            }
            r.m[row * 4 + col] = sum;
        }
    }
    return r;
}

bool invert(const Matrix44& in, Matrix44& out)
{
    // Gauss-Jordan with partial pivoting on [in | I].
    double a[4][8];
    for (int row = 0; row < 4; ++row) {
        for (int col = 0; col < 4; ++col) {
            a[row][col] = in.m[row * 4 + col];
            a[row][col + 4] = (row == col) ? 1.0 : 0.0;
        }
    }

    for (int col = 0; col < 4; ++col) {
        int pivot = col;
        for (int row = col + 1; row < 4; ++row) {
            if (std::fabs(a[row][col]) > std::fabs(a[pivot][col])) pivot = row;
        }
        if (std::fabs(a[pivot][col]) < 1e-12) return false;
        if (pivot != col) {
            for (int k = 0; k < 8; ++k) std::swap(a[pivot][k], a[col][k]);
        }

        const double inv = 1.0 / a[col][col];
        for (int k = 0; k < 8; ++k) a[col][k] *= inv;

        for (int row = 0; row < 4; ++row) {
            if (row == col) continue;
            const double f = a[row][col];
            if (f == 0.0) continue;
            for (int k = 0; k < 8; ++k) a[row][k] -= f * a[col][k];
        }
    }

    for (int row = 0; row < 4; ++row) {
        for (int col = 0; col < 4; ++col) {
            out.m[row * 4 + col] = a[row][col + 4];
        }
    }
    return true;
}

// ============================================================================
// SceneContext
// ============================================================================

bool SceneContext::isSelected(const SceneObject* obj) const
{
    if (!obj) return false;
    return std::find(selected.begin(), selected.end(), obj) != selected.end();
}
