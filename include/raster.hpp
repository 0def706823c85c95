/**
 * raster.hpp
 *
 * Grid abstraction with an in-memory implementation and a GDAL-backed
 * implementation for reading and writing georeferenced band files.
 */

#ifndef INCLUDE_RASTER_HPP_
#define INCLUDE_RASTER_HPP_

#include <stdexcept>
#include <vector>
#include <cstring>
#include <string>
#include <memory>

#include <gdal_priv.h>

#include "specindex.h"

namespace specindex {

    namespace raster {

        // The spatial reference of a raster: the GDAL geotransform and the
        // projection as WKT.

        class DLL_EXPORT GeoRef {
        public:
            double trans[6];
            std::string projection;

            GeoRef();

            // Returns true if the transforms agree to within tol and the
            // projections are identical.
            bool matches(const GeoRef &other, double tol = 1e-9) const;
        };

        // Abstract class for grids (rasters).

        template <class T>
        class DLL_EXPORT Grid {
        public:

            virtual ~Grid() {}

            // Return the number of rows in the dataset.
            virtual int32_t rows() const = 0;

            // Return the number of columns in the dataset.
            virtual int32_t cols() const = 0;

            // Return the number of cells in the dataset.
            virtual size_t size() const = 0;

            // Returns the nodata value.
            virtual T nodata() const = 0;

            // Returns true if a nodata value has been set.
            virtual bool hasNodata() const = 0;

            // Returns true if the other grid has the same number of rows and columns.
            template <class U>
            bool sameShape(const Grid<U> &other) const {
                return cols() == other.cols() && rows() == other.rows();
            }

        };

        // A convenience class for managing a grid of values.
        // Handles allocation and deallocation of memory.

        template <class T>
        class DLL_EXPORT MemRaster : public Grid<T> {
        private:
            T *m_grid;
            int32_t m_cols;
            int32_t m_rows;
            T m_nodata;
            bool m_hasNodata;
            double m_min;
            double m_max;
            double m_mean;
            size_t m_count;
            bool m_stats;

            // Checks if the grid has been initialized. Throws exception otherwise.
            void checkInit() const;

            void freeMem();

            // Returns true if a nodata value is set and the element is nodata.
            bool isNoData(size_t idx) const;

            // Computes descriptive statistics for the values in the grid.
            // Nodata and NaN cells are ignored.
            void computeStats();

        public:
            MemRaster();

            MemRaster(int32_t cols, int32_t rows);

            MemRaster(const MemRaster<T> &other) = delete;

            MemRaster<T>& operator=(const MemRaster<T> &other) = delete;

            ~MemRaster();

            // Return a pointer to the allocated memory.
            T *grid();

            int32_t rows() const;

            int32_t cols() const;

            size_t size() const;

            // Initialize with the given number of cols and rows.
            // (Re)allocates memory for the internal grid.
            void init(int32_t cols, int32_t rows);

            T get(size_t idx) const;

            void set(size_t idx, const T value);

            T nodata() const;

            void nodata(const T nodata);

            bool hasNodata() const;

            // Return the maximum value in the raster.
            double max();

            // Return the minimum value in the raster.
            double min();

            // Return the mean value in the raster.
            double mean();

            // Return the number of valid (not nodata) cells.
            size_t count();

        };

        // A single band of a raster file, read and written through GDAL.
        // Data moves whole-band to and from a MemRaster.

        template <class T>
        class DLL_EXPORT Raster : public Grid<T> {
        private:
            int32_t m_cols, m_rows; // Raster cols/rows
            bool m_writable; // True if the raster is writable
            GDALDataset *m_ds; // GDAL dataset
            GDALRasterBand *m_band; // GDAL band
            GDALDataType m_type; // GDALDataType -- limits the possible template types.
            T m_nodata; // Nodata value.
            bool m_hasNodata; // True if the band defines a nodata value.
            double m_trans[6]; // Raster transform
            std::string m_filename; // Raster filename

            // Get the GDAL type for the given c++ type.
            GDALDataType getType(float v);

            // Get the GDAL type for the current raster.
            GDALDataType getType();

            void checkInit() const;

            // Write the projection data to the given string object.
            void projection(std::string &proj) const;

            Raster();

        public:

            // Create a new GeoTIFF for writing with the given size, spatial
            // reference and nodata value.
            Raster(const std::string &filename, int32_t band, int32_t cols, int32_t rows,
                    const GeoRef &georef, double nodata);

            // Open the given raster and load the given band. Set the writable argument to true
            // to enable writing.
            Raster(const std::string &filename, int32_t band = 1, bool writable = false);

            Raster(const Raster<T> &other) = delete;

            Raster<T>& operator=(const Raster<T> &other) = delete;

            // Initializes a new GeoTIFF with the given size, spatial reference and nodata value.
            void init(const std::string &filename, int32_t band, int32_t cols, int32_t rows,
                    const GeoRef &georef, double nodata);

            // Initializes a Raster from the existing file.
            void init(const std::string &filename, int32_t band = 1, bool writable = false);

            // Read the whole band into the grid, which is resized to fit.
            void readBlock(MemRaster<T> &grd);

            // Write the whole band from the grid, which must have the same shape.
            void writeBlock(MemRaster<T> &grd);

            // Return the transform and projection.
            GeoRef georef() const;

            // Return the GDAL datatype of the raster.
            GDALDataType type() const;

            T nodata() const;

            bool hasNodata() const;

            int32_t cols() const;

            int32_t rows() const;

            size_t size() const;

            // Flush and close the dataset. Throws if the dataset could not be
            // completely written.
            void close();

            ~Raster();

        };

    } // raster

} // specindex


#endif
