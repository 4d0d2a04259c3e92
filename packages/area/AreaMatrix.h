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

#ifndef __area_matrix__
#define __area_matrix__

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include "OsApi.h"
#include "ClassLookup.h"

#include <map>
#include <string>
#include <vector>

/******************************************************************************
 * AREA MATRIX CLASS
 *
 *  Region by class table of accumulated square kilometers. The class columns
 *  are fixed at construction and region rows are added as they are first seen.
 *  Not thread safe; each aggregation thread fills its own matrix and the
 *  results are merged once the threads are joined.
 ******************************************************************************/

class AreaMatrix
{
    public:

        /*--------------------------------------------------------------------
         * Typedefs
         *--------------------------------------------------------------------*/

        typedef struct {
            std::string         region;
            std::vector<double> values;     // one per column, in column order
        } row_t;

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

        explicit                        AreaMatrix      (const std::vector<class_key_t>& _columns);

        void                            ensureRegion    (const std::string& region);
        void                            add             (const std::string& region, const class_key_t& key, double km2);
        void                            merge           (const AreaMatrix& other);

        double                          get             (const std::string& region, const class_key_t& key) const;
        double                          total           (const std::string& region) const;
        bool                            hasRegion       (const std::string& region) const;
        int                             numRegions      (void) const { return static_cast<int>(rows.size()); }
        const std::vector<class_key_t>& getColumns      (void) const { return columns; }
        std::vector<row_t>              serialize       (void) const;

    private:

        /*--------------------------------------------------------------------
         * Data
         *--------------------------------------------------------------------*/

        std::vector<class_key_t>                    columns;
        std::map<class_key_t, int>                  columnIndex;
        std::map<std::string, std::vector<double>>  rows;
};

#endif  /* __area_matrix__ */
