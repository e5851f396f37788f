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
 * Command line driver: parse switches, run the ensemble of random bipartite networks and write the results table.
 *
 * Switches (defaults in brackets):
 *   -p P_min P_max     plant species richness range [8 30]
 *   -a A_min A_max     animal species richness range [16 60]
 *   -b file            analyse a stored interaction matrix (see -N) instead of running the ensemble
 *   -c c_min c_max     connectance range [0.05 0.5]
 *   -n trials          number of simulated networks [1000]
 *   -q T|F             quantitative (weighted) modularity [F]
 *   -r restarts        restarts of the modularity search [10]
 *   -l lambda          rate of the interaction strength distribution [1]
 *   -j workers         worker threads [1]
 *   -f directory       output directory [.]
 *   -o experiment rep  experiment name and replicate number for output file names [DEFAULT 0]
 *   -t traceflag       bit mask of TRACE output, see error.h [0]
 *   -O T|F             write results to file [T]
 *   -N T|F             store the interaction matrix of every trial [F]
 *   -Z seed            fix the global seed, otherwise drawn from std::random_device
 */

#include <iostream>
#include <stdio.h>
#include <armadillo>
#include <vector>
#include <cstdlib>
#include <string.h>
#include <ctype.h>
#include <time.h>
#include <exception>

#include "Simulation.h"
#include "BNSM_rng.h"
#include "error.h"

using namespace std;
using namespace arma;

bool OUTPUT = true; // select write to file
string bFile; // stored interaction matrix to be analysed

// consume the value following switch argv[i-1], reports missing values instead of reading past argv
static const char * nextArg(int argc, char* argv[], int & i) {
    if (i >= argc) {
        PARAMETER_ERROR("missing value for switch " << argv[argc-1]);
    }
    return argv[i];
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
///////////////////////////////////////////// Start of simulation //////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////

int main(int argc, char* argv[]) {

    time_t start;
    time(&start);

    Simulation sim;

    try {

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
/////////////////////////////////////// Store program arguments in variables ///////////////////////////////////////////
////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////

        for (int i = 1; i<argc; i++) { // loop through program arguments an allocate to parameters
            if (argv[i][0] != '-' || !isalpha(argv[i][1])) {
                PARAMETER_ERROR("unrecognised argument " << argv[i]);
            }
            char var1 = argv[i][1];
            i++;

            switch (var1) {
                case 'a' : // set A_min, A_max - animal species richness range (2x int)
                    sim.A_min = atoi(nextArg(argc, argv, i));
                    i++;
                    sim.A_max = atoi(nextArg(argc, argv, i));
                    break;

                case 'b' : // set bFile - import a stored network for analysis (string)
                    bFile = nextArg(argc, argv, i);
                    break;

                case 'c' : // set c_min, c_max - connectance range (2x double)
                    sim.c_min = atof(nextArg(argc, argv, i));
                    i++;
                    sim.c_max = atof(nextArg(argc, argv, i));
                    break;

                case 'f' : // set outputDirectory - location for write to file (string)
                    sim.outputDirectory = nextArg(argc, argv, i);
                    break;

                case 'j' : // set workers - number of worker threads (int)
                    sim.workers = atoi(nextArg(argc, argv, i));
                    break;

                case 'l' : // set lambda - rate of the exponential interaction strength distribution (double)
                    sim.lambda = atof(nextArg(argc, argv, i));
                    break;

                case 'n' : // set trials - number of simulated networks (int)
                    sim.trials = atoi(nextArg(argc, argv, i));
                    break;

                case 'o' : // set experiment, rep - experiment name, replicate number for output filenames (string, int)
                    sim.experiment = nextArg(argc, argv, i);
                    i++;
                    sim.rep = atoi(nextArg(argc, argv, i));
                    break;

                case 'p' : // set P_min, P_max - plant species richness range (2x int)
                    sim.P_min = atoi(nextArg(argc, argv, i));
                    i++;
                    sim.P_max = atoi(nextArg(argc, argv, i));
                    break;

                case 'q' : // set quantitative - select weighted modularity (bool)
                    if (!strcmp(nextArg(argc, argv, i),"T")) {
                        sim.quantitative = true;
                    }
                    break;

                case 'r' : // set restarts - restarts of the modularity search (int)
                    sim.restarts = atoi(nextArg(argc, argv, i));
                    break;

                case 't' : // set TRACEFLAG - select TRACE output (int)
                    TRACEFLAG = atoi(nextArg(argc, argv, i));
                    break;

                // Switches
                case 'N' : // set storeNetworks - write each interaction matrix to file (bool)
                    if (!strcmp(nextArg(argc, argv, i),"T")) {
                        sim.storeNetworks = true;
                    }
                    break;

                case 'O' : // set OUTPUT - select write to file (bool)
                    if (!strcmp(nextArg(argc, argv, i),"F")) {
                        OUTPUT = false;
                    }
                    break;

                case 'Z' : // set seed - fix global seed (unsigned int)
                    sim.seed = strtoul(nextArg(argc, argv, i), NULL, 10);
                    break;

                default :
                    PARAMETER_ERROR("unknown switch -" << var1);
            }
        }

        sim.validate();

    } catch (parameter_error & e) {
        cout << "ERROR: " << e.what() << endl;
        return 1;
    }

    signal_handling(); // SIGTERM etc. stop the ensemble between trials, completed trials are still written

    sim.printParams();

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
////////////////////////////////////////////////// Run the ensemble ////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////

    try {
        if (bFile.empty()) {
            sim.run();
        } else {
            SimulationTrial row = sim.analyseStored(bFile);
            sim.results.clear();
            sim.results.append(row);
            vector<string> names = ResultsTable::columnNames();
            rowvec values = sim.results.asMat().row(0);
            for (uword j=0; j<values.n_elem; j++) {
                cout << "\n" << names[j] << " " << values(j);
            }
            cout << endl;
        }
        if (OUTPUT) {
            sim.saveResults();
        }
    } catch (parameter_error & e) {
        cout << "ERROR: " << e.what() << endl;
        return 1;
    } catch (terminal_condition & e) {
        cout << "ERROR: " << e.what() << endl;
        return 1;
    } catch (std::exception & e) {
        cout << "ERROR: " << e.what() << endl;
        return 1;
    }

    time_t finish;
    time(&finish);
    cout << "\nSimulation complete, elapsed time " << difftime(finish, start) << " seconds" << endl;

    return 0;
}

// Local Variables:
// c-file-style: "stroustrup"
// End:
