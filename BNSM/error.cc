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

#include "error.h"
#include <signal.h>
#include <stdlib.h>

int TRACEFLAG=0; //report nothing

volatile sig_atomic_t exit_now=0;

std::mutex io_mutex;

void exiter(int i){
    // To make signaling of running jobs work in torque, you need to
    // make sure that the shells running the job to not catch the
    // signal.  For this, put this lines into the file ~/.bash_profile
    // AND into the job execution script:
    //
    // trap "" SIGXCPU SIGHUP SIGTERM
    //
    // The driver polls exit_now between trials and writes the completed
    // part of the results table before returning.
    switch(i){
    case SIGINT:
        if (exit_now) { // second interrupt, give up immediately
            signal(SIGINT, SIG_DFL);
            raise(SIGINT);
        }
        exit_now=1;
        break;
    default:
        exit_now=1;
        break;
    }
    signal_handling();
}

void signal_handling(){
    signal(SIGINT,&exiter);
    signal(SIGXCPU,&exiter);
    signal(SIGHUP,&exiter);
    signal(SIGTERM,&exiter);
}

// Local Variables:
// c-file-style: "stroustrup"
// End:
