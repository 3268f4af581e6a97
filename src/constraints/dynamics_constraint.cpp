#include "constraints/dynamics_constraint.hpp"

DynamicsConstraint::DynamicsConstraint(const QpLayout& layout,
                                       const DynamicsQuantities& dyn,
                                       const Eigen::MatrixXd& J_c)
{
    A_.setZero(layout.nv, layout.numVars());

    A_.block(0, layout.vd(),  layout.nv, layout.nv) = dyn.M;
    A_.block(0, layout.tau(), layout.nv, layout.na) = -dyn.S.transpose();

    for (int k = 0; k < layout.nc; ++k)
        A_.block(0, layout.force(k), layout.nv, 3) = -J_c.middleRows(3 * k, 3).transpose();

    b_ = -(dyn.Cv + dyn.tau_g);
}
