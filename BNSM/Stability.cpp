////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
///////////////////////////////////// The Bipartite Network Stability Model (BNSM) /////////////////////////////////////
////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
////////////// Random bipartite interaction networks: structure, community matrices and linear stability //////////////
////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////

/*
    Copyright (C) 2022  Jacob D. O'Sullivan, Axel G. Rossberg

    This file is part of BNSM

    BNSM is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program.  If not, see <https://www.gnu.org/licenses/>.
*/



/*
 * Local stability of a community matrix from its eigenvalue spectrum.
 */

#include <iostream>
#include <armadillo>

#include "Stability.h"
#include "error.h"

using namespace std;
using namespace arma;

bool dominantEigenvalue(const mat & J, cx_double & lambda) {

    // summary:
        // full (non-symmetric) eigen decomposition, the dominant eigenvalue governs the asymptotic return rate

    if (J.n_elem == 0 || !J.is_finite()) {
        return false;
    }

    cx_vec eigval;
    if (!eig_gen(eigval, J)) {
        return false;
    }

    uword k = index_max(real(eigval));
    lambda = eigval(k);
    return true;
}

double resilience(const CommunityMatrix & cm) {

    // summary:
        // resilience = -Re(lambda_max), positive values indicate a locally stable equilibrium

    // arguments:
        // cm - community matrix, see CommunityMatrix::genJacobian()

    // output:
        // resilience, 0 by convention if there is no interaction (selfReg and all eigenvalues vanish)

    if (cm.isDegenerate()) {
        return 0.0;
    }

    cx_double lambda;
    if (!dominantEigenvalue(cm.jacobian, lambda)) {
        WARNING("eigen decomposition failed for " << cm.S() << "x" << cm.S() << " community matrix, sign = "
                << cm.sign << ", resilience set to nan");
        return datum::nan;
    }

    TRACE(lambda, STABILITY);
    return -lambda.real();
}

// Local Variables:
// c-file-style: "stroustrup"
// End:
