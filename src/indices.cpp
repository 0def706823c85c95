#include <vector>
#include <string>
#include <cmath>
#include <limits>

#include <eigen3/Eigen/Core>

#include "specindex.h"
#include "errors.hpp"
#include "util.hpp"
#include "raster.hpp"
#include "indices.hpp"

using namespace specindex;
using namespace specindex::index;
using namespace specindex::raster;
using namespace specindex::bands;

namespace {

	typedef Eigen::Array<double, Eigen::Dynamic, 1> Values;
	typedef Eigen::Array<bool, Eigen::Dynamic, 1> Mask;
	typedef Eigen::Map<Eigen::Array<float, Eigen::Dynamic, 1> > GridMap;

	// The number of pixels evaluated at once. Strips hold whole rows.
	const size_t STRIP_PIXELS = 1 << 16;

	// Computes the numerator and denominator of an index over one strip. The
	// bands are given in the order of the index's roles.
	typedef void (*RatioFn)(const std::vector<Values> &, const IndexParams &, Values &, Values &);

	// A row of the index table.
	class IndexDef {
	public:
		Index index;
		std::string name;
		std::vector<Role> roles;
		bool clipped;
		double lo;
		double hi;
		RatioFn fn;

		IndexDef(Index index, const std::string &name, const std::vector<Role> &roles,
				bool clipped, double lo, double hi, RatioFn fn) :
			index(index), name(name), roles(roles),
			clipped(clipped), lo(lo), hi(hi),
			fn(fn) {
		}
	};

	// (a - b) / (a + b)
	void normalizedDifference(const std::vector<Values> &b, const IndexParams &, Values &num, Values &den) {
		num = b[0] - b[1];
		den = b[0] + b[1];
	}

	// (1 + L)(N - R) / (N + R + L)
	void saviFn(const std::vector<Values> &b, const IndexParams &p, Values &num, Values &den) {
		num = (1.0 + p.soilL) * (b[0] - b[1]);
		den = b[0] + b[1] + p.soilL;
	}

	// G(N - R) / (N + C1 R - C2 B + L)
	void eviFn(const std::vector<Values> &b, const IndexParams &p, Values &num, Values &den) {
		num = p.gain * (b[0] - b[1]);
		den = b[0] + p.c1 * b[1] - p.c2 * b[2] + p.canopyL;
	}

	// (N - RB) / (N + RB) with RB = 2R - B
	void arviFn(const std::vector<Values> &b, const IndexParams &, Values &num, Values &den) {
		auto rb = 2.0 * b[1] - b[2];
		num = b[0] - rb;
		den = b[0] + rb;
	}

	// N / G - 1
	void gciFn(const std::vector<Values> &b, const IndexParams &, Values &num, Values &den) {
		num = b[0] - b[1];
		den = b[1];
	}

	// Indexed by the Index enumeration.
	const std::vector<IndexDef>& table() {
		static const std::vector<IndexDef> defs = {
			IndexDef(Index::NDVI, "NDVI", {Role::NIR, Role::Red},              true, -1.0, 1.0, normalizedDifference),
			IndexDef(Index::SAVI, "SAVI", {Role::NIR, Role::Red},              false, 0.0, 0.0, saviFn),
			IndexDef(Index::EVI,  "EVI",  {Role::NIR, Role::Red, Role::Blue},  false, 0.0, 0.0, eviFn),
			IndexDef(Index::ARVI, "ARVI", {Role::NIR, Role::Red, Role::Blue},  false, 0.0, 0.0, arviFn),
			IndexDef(Index::NBR,  "NBR",  {Role::NIR, Role::SWIR2},            true, -1.0, 1.0, normalizedDifference),
			IndexDef(Index::NBWI, "NBWI", {Role::Green, Role::NIR},            true, -1.0, 1.0, normalizedDifference),
			IndexDef(Index::NDBI, "NDBI", {Role::SWIR1, Role::NIR},            true, -1.0, 1.0, normalizedDifference),
			IndexDef(Index::GCI,  "GCI",  {Role::NIR, Role::Green},            false, 0.0, 0.0, gciFn)
		};
		return defs;
	}

	const IndexDef& def(Index index) {
		size_t i = (size_t) index;
		const std::vector<IndexDef> &t = table();
		if(i >= t.size())
			si_argerr("Unknown index: " << i);
		return t[i];
	}

	void checkShapes(const std::vector<MemRaster<float>*> &bands) {
		if(bands.empty())
			si_argerr("No bands given.");
		for(MemRaster<float> *b : bands) {
			if(b == nullptr || !b->size())
				si_argerr("Uninitialized band grid.");
		}
		for(size_t i = 1; i < bands.size(); ++i) {
			if(!bands[i]->sameShape(*bands[0]))
				si_throw(ShapeMismatchError, "Band shapes differ: " << bands[0]->cols() << "x" << bands[0]->rows()
					<< " vs " << bands[i]->cols() << "x" << bands[i]->rows());
		}
	}

	// Evaluate the index strip by strip into out. A pixel is nodata if it is
	// NaN or nodata in any band, if the denominator is degenerate, or if the
	// result is not a finite float. Results of clipped indices are clipped
	// to their range.
	void evaluate(Index index, const std::vector<MemRaster<float>*> &bands,
			MemRaster<float> &out, const IndexParams &params) {
		const IndexDef &d = def(index);
		checkShapes(bands);

		MemRaster<float> &tpl = *bands[0];
		out.init(tpl.cols(), tpl.rows());
		out.nodata(params.nodata);

		const double nodata = params.nodata;
		const double epsilon = params.epsilon;
		const double top = std::numeric_limits<float>::max();
		const double undefined = std::numeric_limits<double>::quiet_NaN();
		const size_t strip = si_max((size_t) 1, STRIP_PIXELS / (size_t) tpl.cols()) * (size_t) tpl.cols();

		std::vector<Values> b(bands.size());
		Values num;
		Values den;
		Values q;
		Mask bad;
		for(size_t off = 0; off < out.size(); off += strip) {
			size_t len = si_min(strip, out.size() - off);
			bad.setConstant(len, false);
			for(size_t i = 0; i < bands.size(); ++i) {
				GridMap m(bands[i]->grid() + off, len);
				b[i] = m.cast<double>();
				bad = bad || m.isNaN();
				if(bands[i]->hasNodata() && !std::isnan(bands[i]->nodata()))
					bad = bad || (m == bands[i]->nodata());
			}
			d.fn(b, params, num, den);
			// Degenerate denominators come back as NaN and are caught below.
			q = num.binaryExpr(den, [epsilon, undefined](double n, double dn) {
				return safeDivide(n, dn, epsilon, undefined);
			});
			bad = bad || !(q.abs() <= top);
			GridMap res(out.grid() + off, len);
			if(d.clipped) {
				res = bad.select(nodata, q.max(d.lo).min(d.hi)).cast<float>();
			} else {
				res = bad.select(nodata, q).cast<float>();
			}
		}
	}

} // anon


const std::vector<Index>& specindex::index::allIndices() {
	static const std::vector<Index> all = {
		Index::NDVI, Index::SAVI, Index::EVI, Index::ARVI,
		Index::NBR, Index::NBWI, Index::NDBI, Index::GCI
	};
	return all;
}

std::string specindex::index::name(Index index) {
	return def(index).name;
}

Index specindex::index::fromName(const std::string &name) {
	std::string n = specindex::util::Util::upper(name);
	for(const IndexDef &d : table()) {
		if(d.name == n)
			return d.index;
	}
	si_argerr("Unknown index: " << name);
}

const std::vector<Role>& specindex::index::roles(Index index) {
	return def(index).roles;
}

bool specindex::index::range(Index index, double &lo, double &hi) {
	const IndexDef &d = def(index);
	if(d.clipped) {
		lo = d.lo;
		hi = d.hi;
	}
	return d.clipped;
}

double specindex::index::safeDivide(double num, double den, double epsilon, double nodata) {
	if(!std::isfinite(den) || std::abs(den) < epsilon)
		return nodata;
	return num / den;
}

void specindex::index::ndvi(MemRaster<float> &nir, MemRaster<float> &red, MemRaster<float> &out, const IndexParams &params) {
	evaluate(Index::NDVI, {&nir, &red}, out, params);
}

void specindex::index::savi(MemRaster<float> &nir, MemRaster<float> &red, MemRaster<float> &out, const IndexParams &params) {
	evaluate(Index::SAVI, {&nir, &red}, out, params);
}

void specindex::index::evi(MemRaster<float> &nir, MemRaster<float> &red, MemRaster<float> &blue,
		MemRaster<float> &out, const IndexParams &params) {
	evaluate(Index::EVI, {&nir, &red, &blue}, out, params);
}

void specindex::index::arvi(MemRaster<float> &nir, MemRaster<float> &red, MemRaster<float> &blue,
		MemRaster<float> &out, const IndexParams &params) {
	evaluate(Index::ARVI, {&nir, &red, &blue}, out, params);
}

void specindex::index::nbr(MemRaster<float> &nir, MemRaster<float> &swir2, MemRaster<float> &out, const IndexParams &params) {
	evaluate(Index::NBR, {&nir, &swir2}, out, params);
}

void specindex::index::nbwi(MemRaster<float> &green, MemRaster<float> &nir, MemRaster<float> &out, const IndexParams &params) {
	evaluate(Index::NBWI, {&green, &nir}, out, params);
}

void specindex::index::ndbi(MemRaster<float> &swir1, MemRaster<float> &nir, MemRaster<float> &out, const IndexParams &params) {
	evaluate(Index::NDBI, {&swir1, &nir}, out, params);
}

void specindex::index::gci(MemRaster<float> &nir, MemRaster<float> &green, MemRaster<float> &out, const IndexParams &params) {
	evaluate(Index::GCI, {&nir, &green}, out, params);
}

void specindex::index::compute(Index index, const std::vector<MemRaster<float>*> &bands,
		MemRaster<float> &out, const IndexParams &params) {
	const IndexDef &d = def(index);
	if(bands.size() != d.roles.size())
		si_argerr(d.name << " requires " << d.roles.size() << " bands; " << bands.size() << " given.");
	try {
		evaluate(index, bands, out, params);
	} catch(const ShapeMismatchError &) {
		throw;
	} catch(const std::exception &e) {
		si_throw(ComputationError, d.name << ": " << e.what());
	}
}
