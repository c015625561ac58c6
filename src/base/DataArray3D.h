///////////////////////////////////////////////////////////////////////////////
///
///	\file    DataArray3D.h
///	\author  Paul Ullrich
///	\version October 18, 2026
///
///	<remarks>
///		Copyright 2000-2010 Paul Ullrich
///
///		This file is distributed as part of the Tempest source code package.
///		Permission is granted to use, copy, modify and distribute this
///		source code and its documentation under the terms of the GNU General
///		Public License.  This software is provided "as is" without express
///		or implied warranty.
///	</remarks>

#ifndef _DATAARRAY3D_H_
#define _DATAARRAY3D_H_

///////////////////////////////////////////////////////////////////////////////

#include "Exception.h"

#include <cstdlib>
#include <cstring>

///	<summary>
///		A three-dimensional row-major array that owns its storage.  Fields
///		are stored as (level, row, column).
///	</summary>
template <typename T>
class DataArray3D {

public:
	typedef T ValueType;

	///	<summary>
	///		Constructor.
	///	</summary>
	DataArray3D() :
		m_data1D(NULL)
	{
		m_sSize[0] = 0;
		m_sSize[1] = 0;
		m_sSize[2] = 0;
	}

	///	<summary>
	///		Constructor allowing specification of size.
	///	</summary>
	DataArray3D(
		size_t sSize0,
		size_t sSize1,
		size_t sSize2
	) :
		m_data1D(NULL)
	{
		m_sSize[0] = 0;
		m_sSize[1] = 0;
		m_sSize[2] = 0;
		Allocate(sSize0, sSize1, sSize2);
	}

	///	<summary>
	///		Copy constructor.
	///	</summary>
	DataArray3D(const DataArray3D<T> & da) :
		m_data1D(NULL)
	{
		m_sSize[0] = 0;
		m_sSize[1] = 0;
		m_sSize[2] = 0;
		Assign(da);
	}

	///	<summary>
	///		Destructor.
	///	</summary>
	~DataArray3D() {
		Deallocate();
	}

	///	<summary>
	///		Allocate (and zero) data in this DataArray3D.
	///	</summary>
	void Allocate(
		size_t sSize0,
		size_t sSize1,
		size_t sSize2
	) {
		Deallocate();

		if ((sSize0 == 0) || (sSize1 == 0) || (sSize2 == 0)) {
			return;
		}

		m_sSize[0] = sSize0;
		m_sSize[1] = sSize1;
		m_sSize[2] = sSize2;
		m_data1D = new T[sSize0 * sSize1 * sSize2];

		Zero();
	}

	///	<summary>
	///		Release the data of this DataArray3D.
	///	</summary>
	void Deallocate() {
		if (m_data1D != NULL) {
			delete[] m_data1D;
		}
		m_sSize[0] = 0;
		m_sSize[1] = 0;
		m_sSize[2] = 0;
		m_data1D = NULL;
	}

	///	<summary>
	///		Determine if this DataArray3D holds data.
	///	</summary>
	bool IsAttached() const {
		return (m_data1D != NULL);
	}

public:
	///	<summary>
	///		Get the total number of elements.
	///	</summary>
	inline size_t GetTotalSize() const {
		return (m_sSize[0] * m_sSize[1] * m_sSize[2]);
	}

	///	<summary>
	///		Get the size of the given dimension.
	///	</summary>
	inline size_t GetSize(int dim) const {
		return m_sSize[dim];
	}

	///	<summary>
	///		Number of elements in one slice along the first dimension.
	///	</summary>
	inline size_t GetSliceSize() const {
		return (m_sSize[1] * m_sSize[2]);
	}

public:
	///	<summary>
	///		Assignment operator.
	///	</summary>
	void Assign(const DataArray3D<T> & da) {
		if (&da == this) {
			return;
		}
		if (!da.IsAttached()) {
			Deallocate();
			return;
		}
		if ((m_sSize[0] != da.m_sSize[0]) ||
		    (m_sSize[1] != da.m_sSize[1]) ||
		    (m_sSize[2] != da.m_sSize[2])
		) {
			Allocate(da.m_sSize[0], da.m_sSize[1], da.m_sSize[2]);
		}
		memcpy(m_data1D, da.m_data1D, GetTotalSize() * sizeof(T));
	}

	///	<summary>
	///		Assignment operator.
	///	</summary>
	DataArray3D<T> & operator= (const DataArray3D<T> & da) {
		Assign(da);
		return (*this);
	}

	///	<summary>
	///		Zero the data content of this object.
	///	</summary>
	void Zero() {
		if (!IsAttached()) {
			_EXCEPTIONT("Attempted operation on unattached DataArray3D");
		}
		memset(m_data1D, 0, GetTotalSize() * sizeof(T));
	}

public:
	///	<summary>
	///		Pointer to the first element of slice k.
	///	</summary>
	inline T * operator[](size_t k) {
		return (m_data1D + k * m_sSize[1] * m_sSize[2]);
	}

	///	<summary>
	///		Pointer to the first element of slice k.
	///	</summary>
	inline const T * operator[](size_t k) const {
		return (m_data1D + k * m_sSize[1] * m_sSize[2]);
	}

	///	<summary>
	///		Parenthetical array accessor.
	///	</summary>
	inline T & operator()(size_t k, size_t i, size_t j) {
#if defined(DEBUG_ARRAYOUTOFBOUNDS)
		if ((k >= m_sSize[0]) || (i >= m_sSize[1]) || (j >= m_sSize[2])) {
			_EXCEPTIONT("Array access out of bounds");
		}
#endif
		return (*(m_data1D + (k * m_sSize[1] + i) * m_sSize[2] + j));
	}

	///	<summary>
	///		Parenthetical array accessor.
	///	</summary>
	inline const T & operator()(size_t k, size_t i, size_t j) const {
#if defined(DEBUG_ARRAYOUTOFBOUNDS)
		if ((k >= m_sSize[0]) || (i >= m_sSize[1]) || (j >= m_sSize[2])) {
			_EXCEPTIONT("Array access out of bounds");
		}
#endif
		return (*(m_data1D + (k * m_sSize[1] + i) * m_sSize[2] + j));
	}

	///	<summary>
	///		Get a pointer to the data.
	///	</summary>
	inline T * GetData() {
		return m_data1D;
	}

	///	<summary>
	///		Get a pointer to the data.
	///	</summary>
	inline const T * GetData() const {
		return m_data1D;
	}

private:
	///	<summary>
	///		The size of each dimension of this DataArray3D.
	///	</summary>
	size_t m_sSize[3];

	///	<summary>
	///		A pointer to the data for this DataArray3D.
	///	</summary>
	T * m_data1D;
};

///////////////////////////////////////////////////////////////////////////////

#endif

