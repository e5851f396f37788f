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
 * Random number machinery. Every stochastic routine of the model takes an engine by reference; engines are derived
 * from a global seed and the trial index so that a trial's draws do not depend on which worker thread runs it.
 */

#ifndef BNSM_RNG_H
#define BNSM_RNG_H

#include <boost/random.hpp>

namespace BNSM_rng
{
    typedef boost::random::mt19937 engine;

    unsigned int draw_seed(); // non-deterministic seed, used when no seed is fixed on the command line
    engine trial_engine(unsigned int seed, unsigned int trial); // independent stream for trial 'trial'
}

#endif //BNSM_RNG_H

// Local Variables:
// c-file-style: "stroustrup"
// End:
