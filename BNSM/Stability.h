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

#ifndef BNSM_STABILITY_H
#define BNSM_STABILITY_H

#include <armadillo>
#include "CommunityMatrix.h"

using namespace std;
using namespace arma;

// eigenvalue with the largest real part, false if the eigen decomposition fails
bool dominantEigenvalue(const mat & J, cx_double & lambda);

// -Re(dominant eigenvalue); 0 for the degenerate (interaction free) matrix, nan if the decomposition fails
double resilience(const CommunityMatrix & cm);

#endif //BNSM_STABILITY_H

// Local Variables:
// c-file-style: "stroustrup"
// End:
