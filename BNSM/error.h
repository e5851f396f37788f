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

#include <string.h>
#include <errno.h>
#include <iostream>
#include <sstream>
#include <string>
#include <mutex>
#include <signal.h>
#include <math.h>  // must not be <cmath> because this breaks isnan.

extern std::mutex io_mutex; // serializes console output of worker threads

#ifndef BNSM_ERROR_H
#define BNSM_ERROR_H

class terminal_condition {
    std::string message;
public:
    terminal_condition(const std::string & m):message(m){};
    terminal_condition():message("no message"){};
    const char * what() const {return message.c_str();};
    operator const char *() const {return message.c_str();};
};

// raised when a simulation is configured with values outside their admissible range
class parameter_error {
    std::string message;
public:
    parameter_error(const std::string & m):message(m){};
    const char * what() const {return message.c_str();};
};

#define FATAL_ERROR(MSG) do{					\
  std::ostringstream _MSG_;                                     \
  _MSG_ << __FILE__ << ':' << __LINE__ << ':' << MSG;           \
  std::cout << _MSG_.str() << std::endl;                        \
  throw terminal_condition(_MSG_.str());                        \
}while(0)

#define PARAMETER_ERROR(MSG) do{				\
  std::ostringstream _MSG_;                                     \
  _MSG_ << MSG;                                                 \
  throw parameter_error(_MSG_.str());                           \
}while(0)

#define SYS_ERROR() FATAL_ERROR(strerror(errno));

#define WARNING(MSG) do{					\
  std::lock_guard<std::mutex> _LOCK_(io_mutex);			\
  std::cout << __FILE__ << ':' << __LINE__ << ":WARNING:" << MSG << std::endl;	\
}while(0)

#ifdef DEBUGGING
#define DEBUG(MSG) do{					\
  std::cout << __FILE__ << ':' << __LINE__ << ':' << MSG << std::endl;	\
}while(0)
#else
#define DEBUG(MSG)
#endif

#ifdef DEBUGGING
#define ASSERT(X) do{if(!(X)) FATAL_ERROR("Assertation " #X " failed");}while(0)
#else
#define ASSERT(X)
#endif

#define WARN_IF(X,Y)						\
do{if((X)) std::cout << __FILE__ << ':' << __LINE__		\
		     << ": WARNING: " << (#X) << std::endl	\
		     << "************* " << Y << std::endl;	\
 }while(0)

#define ALWAYS_ASSERT(X) do{if(!(X)) FATAL_ERROR("Assertation " #X " failed");}while(0)

#define REPORT(X) std::cout << #X << " = " << (X) << std::endl

extern int TRACEFLAG;

#define TRACE_RANDOM    0x01
#define TRACE_TOPOLOGY  0x02
#define TRACE_METRICS   0x04
#define TRACE_STABILITY 0x08
#define TRACE_DRIVER    0x10

#define TRACE(X,FLG) do{if(TRACE_##FLG&TRACEFLAG){std::cout << __FILE__ << ':' << __LINE__ << ":"  << "TRACE(" << TRACE_##FLG << "): ";  REPORT(X);}}while(0)

void signal_handling();
extern volatile sig_atomic_t exit_now;

#define my_isnan(X) std::isnan(X)
#define my_isinf(X) std::isinf(X)

#endif // BNSM_ERROR_H

// Local Variables:
// c-file-style: "stroustrup"
// End:
