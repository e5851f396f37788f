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
 * This class contains the members and methods required for embedding a bipartite interaction matrix into the square
 * community (Jacobian) matrix of the combined plant-animal community.
 */

#include <iostream>
#include <armadillo>

#include "CommunityMatrix.h"
#include "error.h"

using namespace std;
using namespace arma;

void CommunityMatrix::genJacobian(const mat & W, int a_sign) {

    // summary:
        // plants benefit animals in both regimes, W enters the upper right block with positive sign
        // the effect of animals on plants is +W^T under mutualism and -W^T under antagonism (herbivory)
        // all species share one self-regulation term equal to the largest absolute row sum of the off-diagonal part,
        // so that every row is (weakly) diagonally dominant

    // arguments:
        // W - PxA weighted interaction matrix
        // a_sign - SIGN_MUTUALISM or SIGN_ANTAGONISM

    // output:
        // jacobian - SxS community matrix
        // selfReg - magnitude of the diagonal

    if (a_sign != SIGN_MUTUALISM && a_sign != SIGN_ANTAGONISM) {
        FATAL_ERROR("unknown sign of the animal-on-plant block " << a_sign);
    }

    P = W.n_rows;
    A = W.n_cols;
    sign = a_sign;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
///////////////////////////////////////////// Assemble off-diagonal blocks /////////////////////////////////////////////
////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////

    jacobian.zeros(S(), S());
    if (P > 0 && A > 0) {
        jacobian.submat(0, P, P-1, S()-1) = W; // plant -> animal
        jacobian.submat(P, 0, S()-1, P-1) = double(sign) * W.t(); // animal -> plant
    }

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
//////////////////////////////////////////////// Add self-regulation ///////////////////////////////////////////////////
////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////

    selfReg = 0.0;
    if (jacobian.n_elem > 0) {
        selfReg = max(sum(abs(jacobian), 1)); // diagonal still zero here
    }
    jacobian.diag().fill(-selfReg);

    TRACE(selfReg, STABILITY);
}

bool CommunityMatrix::isDegenerate() const {
    return !(selfReg > 0.0);
}

void genCommunityMatrices(const mat & W, CommunityMatrix & mut, CommunityMatrix & ant) {
    mut.genJacobian(W, SIGN_MUTUALISM);
    ant.genJacobian(W, SIGN_ANTAGONISM);
}

// Local Variables:
// c-file-style: "stroustrup"
// End:
