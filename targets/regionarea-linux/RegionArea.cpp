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

/******************************************************************************
 INCLUDES
 ******************************************************************************/

#include "core.h"
#include "geo.h"
#include "area.h"

#include <stdlib.h>
#include <stdio.h>
#include <signal.h>
#include <string.h>
#include <errno.h>
#include <pthread.h>

/******************************************************************************
 DEFINES
 ******************************************************************************/

#define DEFAULT_CONFIG_SCRIPT "scripts/regionarea.lua"

/******************************************************************************
 FILE DATA
 ******************************************************************************/

static bool app_immediate_abort = false;
static bool app_signal_abort = false;

/******************************************************************************
 LOCAL FUNCTIONS
 ******************************************************************************/

/*
 * console_quick_exit - Signal handler for Control-C
 */
static void console_quick_exit(int parm)
{
    (void)parm;
    if(app_immediate_abort) quick_exit(1);
    print2term("\n...Stopping after the current region!\n");
    setinactive(); // aggregators check this between features
    app_immediate_abort = true; // multiple control-c will exit immediately
}

/*
 * signal_thread - Manages all the SIGINT and SIGTERM signals
 */
static void* signal_thread (void* parm)
{
    sigset_t* signal_set = (sigset_t*)parm;

    while(true)
    {
        int sig = 0;
        int status = sigwait(signal_set, &sig);
        if (status != 0)
        {
            print2term("Fatal error (%d) ...failed to wait for signal: %s\n", status, strerror(errno));
            signal(SIGINT, console_quick_exit);
            break;
        }
        else if(app_signal_abort)
        {
            break; // exit thread for clean up
        }
        else
        {
            console_quick_exit(0);
        }
    }

    return NULL;
}

/*
 * usage
 */
static void usage(const char* prog)
{
    print2term("Usage: %s [-c <config.lua>] [--lc] [--kg] [--sl] [--wk] [--all]\n", prog);
    print2term("  -c <config.lua>   configuration script (default %s)\n", DEFAULT_CONFIG_SCRIPT);
    print2term("  --lc              land cover datasets\n");
    print2term("  --kg              Koppen-Geiger climate datasets\n");
    print2term("  --sl              terrain slope datasets\n");
    print2term("  --wk              soil workability datasets\n");
    print2term("  --all             every dataset above\n");
}

/******************************************************************************
 MAIN
 ******************************************************************************/

int main (int argc, char* argv[])
{
    /* Parse Command Line */
    const char* config_script = DEFAULT_CONFIG_SCRIPT;
    bool selected[AreaParms::NUM_DATASET_FLAGS] = {false, false, false, false};
    bool any_selected = false;
    for(int i = 1; i < argc; i++)
    {
        if(StringLib::match(argv[i], "-c") && (i + 1) < argc)
        {
            config_script = argv[++i];
        }
        else if(StringLib::match(argv[i], "--all"))
        {
            for(int f = 0; f < AreaParms::NUM_DATASET_FLAGS; f++) selected[f] = true;
            any_selected = true;
        }
        else if(argv[i][0] == '-' && argv[i][1] == '-' && AreaParms::isFlag(&argv[i][2]))
        {
            for(int f = 0; f < AreaParms::NUM_DATASET_FLAGS; f++)
            {
                if(StringLib::match(&argv[i][2], AreaParms::DATASET_FLAGS[f])) selected[f] = true;
            }
            any_selected = true;
        }
        else if(StringLib::match(argv[i], "-h") || StringLib::match(argv[i], "--help"))
        {
            usage(argv[0]);
            return 0;
        }
        else
        {
            print2term("Unrecognized option: %s\n", argv[i]);
            usage(argv[0]);
            return 1;
        }
    }

    /* Nothing to do */
    if(!any_selected)
    {
        usage(argv[0]);
        return 0;
    }

    /* Block SIGINT and SIGTERM for all future threads created */
    sigset_t signal_set;
    sigemptyset(&signal_set);
    sigaddset(&signal_set, SIGINT);
    sigaddset(&signal_set, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signal_set, NULL);

    /* Create dedicated signal thread to handle SIGINT and SIGTERM */
    pthread_t signal_pid;
    pthread_create(&signal_pid, NULL, &signal_thread, (void *) &signal_set);

    /* Initialize Built-In Packages */
    initcore();
    initgeo();
    initarea();

    /* Create Lua Engine */
    LuaEngine* interpreter = new LuaEngine("regionarea");
    int errors = 0;

    try
    {
        /* Load Configuration */
        interpreter->executeScript(config_script);
        lua_State* L = interpreter->getState();
        const AreaParms parms(L, lua_gettop(L));
        EventLib::setLvl(parms.log_level);

        /* Run Selected Datasets */
        AreaExtractor extractor(parms);
        for(int f = 0; f < AreaParms::NUM_DATASET_FLAGS && checkactive(); f++)
        {
            if(selected[f])
            {
                errors += extractor.run(AreaParms::DATASET_FLAGS[f]);
            }
        }
    }
    catch(const RunTimeException& e)
    {
        mlog(e.level(), "Failed to run %s: %s", config_script, e.what());
        errors++;
    }

    /* Free Interpreter */
    delete interpreter;

    /* Clean Up Built-In Packages */
    deinitarea();
    deinitgeo();
    deinitcore();

    /* Exit Thread Managing Signals */
    app_signal_abort = true;
    pthread_kill(signal_pid, SIGINT);
    pthread_join(signal_pid, NULL);

    /* Exit Process */
    return (errors > 0) ? 1 : 0;
}
