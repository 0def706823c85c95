#include <string>
#include <cmath>
#include <algorithm>
#include <cstdlib>

#include <gdal_priv.h>
#include <cpl_error.h>

#include "specindex.h"
#include "raster.hpp"

using namespace specindex::raster;


// Implementations for GeoRef
GeoRef::GeoRef() {
	// GDAL's default transform: origin at 0,0; one unit per pixel; north up.
	trans[0] = 0.0; trans[1] = 1.0; trans[2] = 0.0;
	trans[3] = 0.0; trans[4] = 0.0; trans[5] = 1.0;
}

bool GeoRef::matches(const GeoRef &other, double tol) const {
	for(int i = 0; i < 6; ++i) {
		if(std::abs(trans[i] - other.trans[i]) > tol)
			return false;
	}
	return projection == other.projection;
}


// Implementations for MemRaster
template <class T>
void MemRaster<T>::checkInit() const {
	if(m_grid == nullptr)
		si_runerr("This instance has not been initialized.");
}

template <class T>
MemRaster<T>::MemRaster() :
	m_grid(nullptr),
	m_cols(-1), m_rows(-1),
	m_nodata(0),
	m_hasNodata(false),
	m_min(0), m_max(0), m_mean(0),
	m_count(0),
	m_stats(false) {
}

template <class T>
MemRaster<T>::MemRaster(int32_t cols, int32_t rows) : MemRaster() {
	init(cols, rows);
}

template <class T>
MemRaster<T>::~MemRaster() {
	freeMem();
}

template <class T>
T *MemRaster<T>::grid() {
	checkInit();
	// The caller may write through the pointer.
	m_stats = false;
	return m_grid;
}

template <class T>
int32_t MemRaster<T>::rows() const {
	return m_rows;
}

template <class T>
int32_t MemRaster<T>::cols() const {
	return m_cols;
}

template <class T>
size_t MemRaster<T>::size() const {
	if(m_grid == nullptr)
		return 0;
	return (size_t) m_rows * m_cols;
}

template <class T>
void MemRaster<T>::freeMem() {
	if(m_grid) {
		free(m_grid);
		m_grid = nullptr;
	}
}

template <class T>
void MemRaster<T>::init(int32_t cols, int32_t rows) {
	if(cols <= 0 || rows <= 0)
		si_argerr("Invalid row or column count.");
	if(cols != m_cols || rows != m_rows || m_grid == nullptr) {
		freeMem();
		m_cols = cols;
		m_rows = rows;
		m_grid = (T *) malloc(sizeof(T) * cols * rows);
		if(!m_grid)
			si_runerr("Failed to allocate memory for MemRaster.");
	}
	m_stats = false;
}

template <class T>
T MemRaster<T>::get(size_t idx) const {
	checkInit();
	if(idx >= size())
		si_argerr("Index out of bounds.");
	return m_grid[idx];
}

template <class T>
void MemRaster<T>::set(size_t idx, const T value) {
	checkInit();
	if(idx >= size())
		si_argerr("Index out of bounds.");
	m_grid[idx] = value;
	m_stats = false;
}

template <class T>
T MemRaster<T>::nodata() const {
	return m_nodata;
}

template <class T>
void MemRaster<T>::nodata(T nodata) {
	m_nodata = nodata;
	m_hasNodata = true;
	m_stats = false;
}

template <class T>
bool MemRaster<T>::hasNodata() const {
	return m_hasNodata;
}

template <class T>
bool MemRaster<T>::isNoData(size_t idx) const {
	if(!m_hasNodata)
		return false;
	T v = m_grid[idx];
	return v == m_nodata || (std::isnan((double) v) && std::isnan((double) m_nodata));
}

template <class T>
void MemRaster<T>::computeStats() {
	double sum = 0;
	m_count = 0;
	for(size_t i = 0; i < size(); ++i) {
		double v = (double) m_grid[i];
		if(std::isnan(v) || isNoData(i))
			continue;
		if(m_count == 0) {
			m_min = m_max = v;
		} else {
			m_min = si_min(m_min, v);
			m_max = si_max(m_max, v);
		}
		++m_count;
		sum += v;
	}
	if(m_count > 0) {
		m_mean = sum / m_count;
	} else {
		m_min = m_max = m_mean = (double) m_nodata;
	}
	m_stats = true;
}

template <class T>
double MemRaster<T>::max() {
	if(!m_stats)
		computeStats();
	return m_max;
}

template <class T>
double MemRaster<T>::min() {
	if(!m_stats)
		computeStats();
	return m_min;
}

template <class T>
double MemRaster<T>::mean() {
	if(!m_stats)
		computeStats();
	return m_mean;
}

template <class T>
size_t MemRaster<T>::count() {
	if(!m_stats)
		computeStats();
	return m_count;
}


// Implementations for Raster
template <class T>
GDALDataType Raster<T>::getType(float v) {
	(void) v;
	return GDT_Float32;
}

template <class T>
GDALDataType Raster<T>::getType() {
	return getType((T) 0);
}

template <class T>
void Raster<T>::checkInit() const {
	if(m_ds == nullptr)
		si_runerr("This raster has not been initialized.");
}

template <class T>
Raster<T>::Raster() :
	m_cols(-1), m_rows(-1),
	m_writable(false),
	m_ds(nullptr), m_band(nullptr),
	m_type(getType()),
	m_nodata(0),
	m_hasNodata(false) {
	GeoRef g;
	std::copy(g.trans, g.trans + 6, m_trans);
}

template <class T>
Raster<T>::Raster(const std::string &filename, int32_t band, int32_t cols, int32_t rows,
		const GeoRef &georef, double nodata) : Raster() {
	init(filename, band, cols, rows, georef, nodata);
}

template <class T>
Raster<T>::Raster(const std::string &filename, int32_t band, bool writable) : Raster() {
	init(filename, band, writable);
}

template <class T>
void Raster<T>::init(const std::string &filename, int32_t band, int32_t cols, int32_t rows,
		const GeoRef &georef, double nodata) {

	if(cols <= 0 || rows <= 0)
		si_argerr("Invalid row or column count: " << cols << ", " << rows);
	if(band < 1)
		si_argerr("Band number must be 1 or greater.");
	if(filename.empty())
		si_argerr("Filename must be given.");
	if(m_ds)
		close();

	m_filename.assign(filename);

	// Create GDAL dataset.
	GDALAllRegister();
	GDALDriver *drv = GetGDALDriverManager()->GetDriverByName("GTiff");
	if(drv == nullptr)
		si_runerr("The GTiff driver is not available.");
	m_ds = drv->Create(filename.c_str(), cols, rows, band, m_type, NULL);
	if(m_ds == nullptr)
		si_runerr("Failed to create file: " << filename << ": " << CPLGetLastErrorMsg());

	std::copy(georef.trans, georef.trans + 6, m_trans);
	if(m_ds->SetGeoTransform(m_trans) != CE_None)
		si_runerr("Failed to set the geotransform on " << filename);

	// Set projection.
	if(!georef.projection.empty() && m_ds->SetProjection(georef.projection.c_str()) != CE_None)
		si_runerr("Failed to set the projection on " << filename);

	// Save some dataset properties.
	m_rows = m_ds->GetRasterYSize();
	m_cols = m_ds->GetRasterXSize();
	m_band = m_ds->GetRasterBand(band);
	if(m_band == nullptr)
		si_runerr("Failed to get band.");
	if(m_band->SetNoDataValue(nodata) != CE_None)
		si_runerr("Failed to set nodata on " << filename);
	m_nodata = (T) m_band->GetNoDataValue();
	m_hasNodata = true;
	m_writable = true;
}

template <class T>
void Raster<T>::init(const std::string &filename, int32_t band, bool writable) {

	if(filename.empty())
		si_argerr("Filename must be given.");
	if(m_ds)
		close();

	m_filename.assign(filename);

	// Attempt to open the dataset.
	GDALAllRegister();
	m_ds = (GDALDataset *) GDALOpen(filename.c_str(), writable ? GA_Update : GA_ReadOnly);
	if(m_ds == NULL)
		si_runerr("Failed to open raster: " << filename);

	if(band < 1 || band > m_ds->GetRasterCount()) {
		GDALClose(m_ds);
		m_ds = nullptr;
		si_argerr("Band " << band << " does not exist in " << filename);
	}

	if(m_ds->GetGeoTransform(m_trans) != CE_None) {
		GeoRef g;
		std::copy(g.trans, g.trans + 6, m_trans);
	}
	m_band = m_ds->GetRasterBand(band);
	if(m_band == nullptr)
		si_runerr("Failed to get band.");
	m_rows = m_ds->GetRasterYSize();
	m_cols = m_ds->GetRasterXSize();
	int hasNodata = 0;
	double nd = m_band->GetNoDataValue(&hasNodata);
	m_hasNodata = hasNodata != 0;
	m_nodata = m_hasNodata ? (T) nd : (T) 0;
	m_writable = writable;
}

template <class T>
void Raster<T>::readBlock(MemRaster<T> &grd) {
	checkInit();
	grd.init(m_cols, m_rows);
	CPLErr err = CE_None;
	#pragma omp critical(__gdal_io)
	{
		err = m_band->RasterIO(GF_Read, 0, 0, m_cols, m_rows, grd.grid(), m_cols, m_rows, getType(), 0, 0);
	}
	if(err != CE_None)
		si_runerr("Failed to read from band: " << m_filename << ": " << CPLGetLastErrorMsg());
}

template <class T>
void Raster<T>::writeBlock(MemRaster<T> &grd) {
	checkInit();
	if(!m_writable)
		si_runerr("This raster is not writable.");
	if(!this->sameShape(grd))
		si_argerr("Grid size " << grd.cols() << "x" << grd.rows() << " does not match "
			<< m_filename << " (" << m_cols << "x" << m_rows << ")");
	CPLErr err = CE_None;
	#pragma omp critical(__gdal_io)
	{
		err = m_band->RasterIO(GF_Write, 0, 0, m_cols, m_rows, grd.grid(), m_cols, m_rows, getType(), 0, 0);
		if(err == CE_None)
			err = m_band->FlushCache();
	}
	if(err != CE_None)
		si_runerr("Failed to write to band: " << m_filename << ": " << CPLGetLastErrorMsg());
}

template <class T>
void Raster<T>::projection(std::string &proj) const {
	checkInit();
	const char *ref = m_ds->GetProjectionRef();
	proj.assign(ref == nullptr ? "" : ref);
}

template <class T>
GeoRef Raster<T>::georef() const {
	GeoRef g;
	std::copy(m_trans, m_trans + 6, g.trans);
	projection(g.projection);
	return g;
}

template <class T>
GDALDataType Raster<T>::type() const {
	checkInit();
	return m_band->GetRasterDataType();
}

template <class T>
T Raster<T>::nodata() const {
	return m_nodata;
}

template <class T>
bool Raster<T>::hasNodata() const {
	return m_hasNodata;
}

template <class T>
int32_t Raster<T>::cols() const {
	return m_cols;
}

template <class T>
int32_t Raster<T>::rows() const {
	return m_rows;
}

template <class T>
size_t Raster<T>::size() const {
	if(m_ds == nullptr)
		return 0;
	return (size_t) m_cols * m_rows;
}

template <class T>
void Raster<T>::close() {
	if(!m_ds)
		return;
	CPLErrorReset();
	GDALClose(m_ds);
	m_ds = nullptr;
	m_band = nullptr;
	if(m_writable && CPLGetLastErrorType() == CE_Failure)
		si_runerr("Failed to close " << m_filename << ": " << CPLGetLastErrorMsg());
}

template <class T>
Raster<T>::~Raster() {
	if(m_ds)
		GDALClose(m_ds);
}


// Bands are read and written as 32-bit float.
template class specindex::raster::MemRaster<float>;
template class specindex::raster::Raster<float>;
