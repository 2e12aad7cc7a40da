#include "fitmodels/Regression.hpp"
#include <Eigen/QR>
#include <limits>

namespace fitmodels {

std::optional<Vector> polyfit(const Vector& x, const Vector& y, int degree)
{
    const Eigen::Index n     = x.size();
    const Eigen::Index ncoef = degree + 1;

    if (degree < 0 || n != y.size() || n < ncoef) return std::nullopt;
    if (!x.allFinite() || !y.allFinite())         return std::nullopt;

    /* Vandermonde matrix, highest power in column 0 */
    Matrix A(n, ncoef);
    for (Eigen::Index i = 0; i < n; ++i) {
        double p = 1.0;
        for (Eigen::Index j = ncoef - 1; j >= 0; --j) {
            A(i, j) = p;
            p *= x[i];
        }
    }

    /* unit column norms keep the QR well conditioned for large |x| */
    Vector scale = A.colwise().norm().transpose();
    for (Eigen::Index j = 0; j < ncoef; ++j)
        if (scale[j] == 0.0) scale[j] = 1.0;
    A.array().rowwise() /= scale.transpose().array();

    Eigen::ColPivHouseholderQR<Matrix> qr(A);
    qr.setThreshold(static_cast<double>(n) * std::numeric_limits<double>::epsilon());
    if (qr.rank() < ncoef) return std::nullopt;

    Vector p = qr.solve(y).cwiseQuotient(scale);
    if (!p.allFinite()) return std::nullopt;
    return p;
}

} // namespace fitmodels
