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

#ifndef BNSM_COMMUNITYMATRIX_H
#define BNSM_COMMUNITYMATRIX_H

#include <armadillo>

using namespace std;
using namespace arma;

#define SIGN_MUTUALISM 1
#define SIGN_ANTAGONISM -1

class CommunityMatrix {
public:
// members
    int P = 0; // plant species, rows/cols [0,P)
    int A = 0; // animal species, rows/cols [P,P+A)
    int sign = SIGN_MUTUALISM; // sign of the animal-on-plant block
    double selfReg = 0.0; // shared self-regulation magnitude, -jacobian(i,i)

    // matrix objects
    mat jacobian; // SxS community matrix, S = P+A

// methods
    void genJacobian(const mat & W, int a_sign); // assemble community matrix from PxA interaction matrix
    bool isDegenerate() const; // no interaction, jacobian is identically zero
    int S() const {return P + A;};

    // (default) constructor
    CommunityMatrix() {}

    // (default) deconstructor
    ~CommunityMatrix() {}
};

// mutualistic and antagonistic community matrices sharing the same interaction magnitudes
void genCommunityMatrices(const mat & W, CommunityMatrix & mut, CommunityMatrix & ant);

#endif //BNSM_COMMUNITYMATRIX_H

// Local Variables:
// c-file-style: "stroustrup"
// End:
