#include "constraints/contact_constraint.hpp"

ContactConstraint::ContactConstraint(const QpLayout& layout,
                                     const Eigen::MatrixXd& J_c,
                                     const Eigen::VectorXd& Jdv_c,
                                     const Eigen::VectorXd& v,
                                     double damping)
{
    const int rows = 3 * layout.nc;

    A_.setZero(rows, layout.numVars());
    A_.block(0, layout.vd(), rows, layout.nv) = J_c;

    b_ = -Jdv_c - damping * (J_c * v);
}
