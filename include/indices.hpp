#ifndef __INDICES_HPP__
#define __INDICES_HPP__

#include <vector>
#include <string>

#include "specindex.h"
#include "raster.hpp"
#include "bands.hpp"

namespace specindex {

    namespace index {

        // The supported spectral indices.
        enum class Index {
            NDVI,
            SAVI,
            EVI,
            ARVI,
            NBR,
            NBWI,
            NDBI,
            GCI
        };

        // Constants used by the index formulas and the safe-division policy.
        class IndexParams {
        public:
            double soilL;     // SAVI soil brightness correction (L).
            double gain;      // EVI gain (G).
            double c1;        // EVI aerosol coefficient for red (C1).
            double c2;        // EVI aerosol coefficient for blue (C2).
            double canopyL;   // EVI canopy background adjustment (L).
            double epsilon;   // Denominators smaller than this in magnitude are degenerate.
            float nodata;     // Output value for undefined pixels.

            IndexParams() :
                soilL(0.5),
                gain(2.5),
                c1(6.0),
                c2(7.5),
                canopyL(1.0),
                epsilon(1e-10),
                nodata(-9999.0f) {
            }

            void check() const {
                if (!(epsilon > 0))
                    si_argerr("Epsilon must be greater than zero.");
                if (soilL < 0)
                    si_argerr("The SAVI soil factor must not be negative.");
                if (nodata >= -1.0f && nodata <= 1.0f)
                    si_argerr("The nodata value must lie outside of [-1, 1].");
            }
        };

        // All supported indices in canonical order.
        const std::vector<Index>& allIndices();

        // The name of the index, e.g. "NDVI".
        std::string name(Index index);

        // Parse an index name (case-insensitive). Throws std::invalid_argument
        // for an unknown name.
        Index fromName(const std::string &name);

        // The spectral roles of the bands the index requires, in the order
        // the formula takes them.
        const std::vector<specindex::bands::Role>& roles(Index index);

        // If the index defines a valid range, writes it to lo and hi and
        // returns true. Such indices are clipped to their range.
        bool range(Index index, double &lo, double &hi);

        // Divide num by den. Returns nodata where |den| < epsilon or den is
        // not finite. The index functions divide every pixel through this.
        double safeDivide(double num, double den, double epsilon, double nodata);

        // The index functions. Each initializes out to the shape of its
        // inputs and sets its nodata value to params.nodata. Pixels that are
        // nodata or NaN in any input, or whose denominator is degenerate, are
        // set to nodata. Throws ShapeMismatchError if the inputs differ in
        // shape.

        // (NIR - Red) / (NIR + Red); clipped to [-1, 1].
        void ndvi(specindex::raster::MemRaster<float> &nir, specindex::raster::MemRaster<float> &red,
                specindex::raster::MemRaster<float> &out, const IndexParams &params);

        // ((NIR - Red) / (NIR + Red + L)) * (1 + L).
        void savi(specindex::raster::MemRaster<float> &nir, specindex::raster::MemRaster<float> &red,
                specindex::raster::MemRaster<float> &out, const IndexParams &params);

        // G * (NIR - Red) / (NIR + C1 * Red - C2 * Blue + L).
        void evi(specindex::raster::MemRaster<float> &nir, specindex::raster::MemRaster<float> &red,
                specindex::raster::MemRaster<float> &blue, specindex::raster::MemRaster<float> &out,
                const IndexParams &params);

        // (NIR - (2 * Red - Blue)) / (NIR + (2 * Red - Blue)).
        void arvi(specindex::raster::MemRaster<float> &nir, specindex::raster::MemRaster<float> &red,
                specindex::raster::MemRaster<float> &blue, specindex::raster::MemRaster<float> &out,
                const IndexParams &params);

        // (NIR - SWIR2) / (NIR + SWIR2); clipped to [-1, 1].
        void nbr(specindex::raster::MemRaster<float> &nir, specindex::raster::MemRaster<float> &swir2,
                specindex::raster::MemRaster<float> &out, const IndexParams &params);

        // (Green - NIR) / (Green + NIR); clipped to [-1, 1].
        void nbwi(specindex::raster::MemRaster<float> &green, specindex::raster::MemRaster<float> &nir,
                specindex::raster::MemRaster<float> &out, const IndexParams &params);

        // (SWIR1 - NIR) / (SWIR1 + NIR); clipped to [-1, 1].
        void ndbi(specindex::raster::MemRaster<float> &swir1, specindex::raster::MemRaster<float> &nir,
                specindex::raster::MemRaster<float> &out, const IndexParams &params);

        // NIR / Green - 1.
        void gci(specindex::raster::MemRaster<float> &nir, specindex::raster::MemRaster<float> &green,
                specindex::raster::MemRaster<float> &out, const IndexParams &params);

        // Compute the index from bands given in the order of roles(index).
        // Throws ShapeMismatchError for inconsistent shapes and
        // ComputationError for any other failure.
        void compute(Index index, const std::vector<specindex::raster::MemRaster<float>*> &bands,
                specindex::raster::MemRaster<float> &out, const IndexParams &params);

    } // index

} // specindex

#endif
