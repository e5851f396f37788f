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

#include <random>
#include <boost/random.hpp>
#include <boost/random/seed_seq.hpp>

#include "BNSM_rng.h"
#include "error.h"

namespace BNSM_rng
{
    unsigned int draw_seed() {
        std::random_device rd;
        return rd();
    }

    engine trial_engine(unsigned int seed, unsigned int trial) {
        boost::random::seed_seq seq{seed, trial};
        engine eng(seq);
        TRACE(trial, RANDOM);
        return eng;
    }
}

// Local Variables:
// c-file-style: "stroustrup"
// End:
