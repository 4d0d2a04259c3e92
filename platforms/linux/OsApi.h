/*
 * Copyright (c) 2021, University of Washington
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 * 1. Redistributions of source code must retain the above copyright notice,
 *    this list of conditions and the following disclaimer.
 *
 * 2. Redistributions in binary form must reproduce the above copyright notice,
 *    this list of conditions and the following disclaimer in the documentation
 *    and/or other materials provided with the distribution.
 *
 * 3. Neither the name of the University of Washington nor the names of its
 *    contributors may be used to endorse or promote products derived from this
 *    software without specific prior written permission.
 *
 * THIS SOFTWARE IS PROVIDED BY THE UNIVERSITY OF WASHINGTON AND CONTRIBUTORS
 * “AS IS” AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED
 * TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR
 * PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE UNIVERSITY OF WASHINGTON OR
 * CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL,
 * EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO,
 * PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS;
 * OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY,
 * WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR
 * OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF
 * ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */

#ifndef __osapi__
#define __osapi__

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include <stdio.h>
#include <stdint.h>
#include <assert.h>

/******************************************************************************
 * MACROS
 ******************************************************************************/

#ifndef NULL
#define NULL        ((void *) 0)
#endif

#ifndef MIN
#define MIN(a,b)    ((a) < (b) ? (a) : (b))
#endif

#ifndef MAX
#define MAX(a,b)    ((a) > (b) ? (a) : (b))
#endif

#ifdef _GNU_
#define VARG_CHECK(f, a, b) __attribute__((format(f, a, b)))
#else
#define VARG_CHECK(f, a, b)
#endif

#define PATH_DELIMETER '/'
#define PATH_DELIMETER_STR "/"

/******************************************************************************
 * TYPEDEFS
 ******************************************************************************/

typedef enum {
    DEBUG               = 0,
    INFO                = 1,
    WARNING             = 2,
    ERROR               = 3,
    CRITICAL            = 4,
    INVALID_EVENT_LEVEL = 5
} event_level_t;

/******************************************************************************
 * DEFINES
 ******************************************************************************/

#ifndef MAX_STR_SIZE
#define MAX_STR_SIZE 1024
#endif

/* Debug Logging */
#define dlog(...)                   OsApi::print(__FILE__,__LINE__,__VA_ARGS__)

/* Terminal Output */
#define print2term(...)             {printf(__VA_ARGS__); fflush(stdout);}

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include "Thread.h"
#include "Mutex.h"
#include "RunTimeException.h"

/******************************************************************************
 * OSAPI CLASS
 ******************************************************************************/

class OsApi
{
    public:

        /*--------------------------------------------------------------------
         * Constants
         *--------------------------------------------------------------------*/

        static const int SYS_CLK = 0;
        static const int CPU_CLK = 1;
        static const int MAX_PRINT_MESSAGE = 256;

        /*--------------------------------------------------------------------
         * Typedefs
         *--------------------------------------------------------------------*/

        typedef void (*print_func_t) (const char* file_name, unsigned int line_number, const char* message);

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

        static void         init            (print_func_t _print_func);
        static void         deinit          (void);
        static int64_t      time            (int clkid);
        static int64_t      timeres         (int clkid);
        static void         print           (const char* file_name, unsigned int line_number, const char* format_string, ...) VARG_CHECK(printf, 3, 4);
        static int64_t      getLaunchTime   (void);

    private:

        /*--------------------------------------------------------------------
         * Data
         *--------------------------------------------------------------------*/

        static print_func_t print_func;
        static int64_t launch_time;
};

#endif  /* __osapi__ */
