#pragma once
#include "Types.hpp"
#include "ParameterRecord.hpp"

namespace droview {

/*  Tracer-kinetic forward models.  All take the time grid t [min], the
 *  arterial input function ca [mM] sampled on t and the fitted
 *  parameters, and return the tissue concentration on t.
 *
 *  Parameter names follow the reference object:
 *      tofts / extendedtofts : Kt, ve, vp (optional), kep (optional)
 *      uptake                : Fp, PS, vp
 *      exchange              : Fp, PS, ve, vp
 */
Vector model_tofts   (const Vector& t, const Vector& ca, const ParameterRecord& p);
Vector model_uptake  (const Vector& t, const Vector& ca, const ParameterRecord& p);
Vector model_exchange(const Vector& t, const Vector& ca, const ParameterRecord& p);

} // namespace droview
