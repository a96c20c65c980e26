#include "hymat/matrix.hpp"
#include <gtest/gtest.h>
#include <cmath>

using hymat::Complex;
using hymat::Entry;
using hymat::Integer;
using hymat::Matrix;
using hymat::MatrixType;
using hymat::NumericMode;
using hymat::Real;

namespace {

Real real_at(const Matrix& m, size_t i, size_t j) {
  return std::get<Real>(m.get(i, j));
}

}  // namespace

// ===== Determinant =====

TEST(DeterminantTest, RealTwoByTwo) {
  Matrix m{{1.0, 2.0}, {3.0, 4.0}};
  EXPECT_NEAR(std::get<Real>(m.determinant()), -2.0, 1e-12);
}

TEST(DeterminantTest, RealThreeByThree) {
  Matrix m{{2.0, -1.0, 0.0}, {-1.0, 2.0, -1.0}, {0.0, -1.0, 2.0}};
  EXPECT_NEAR(std::get<Real>(m.determinant()), 4.0, 1e-12);
}

TEST(DeterminantTest, IntegerIsExact) {
  Matrix m{{Integer(1), Integer(2)}, {Integer(3), Integer(4)}};
  EXPECT_EQ(std::get<Integer>(m.determinant()), Integer(-2));

  Matrix m3{{Integer(1), Integer(2), Integer(3)},
            {Integer(0), Integer(1), Integer(4)},
            {Integer(5), Integer(6), Integer(0)}};
  EXPECT_EQ(std::get<Integer>(m3.determinant()), Integer(1));

  Integer big("123456789123456789123456789");
  Matrix d{{big, Integer(0)}, {Integer(0), big}};
  EXPECT_EQ(std::get<Integer>(d.determinant()), Integer(big * big));
}

TEST(DeterminantTest, IntegerFractionalMultiplierThrows) {
  Matrix m{{Integer(2), Integer(1)}, {Integer(1), Integer(1)}};
  EXPECT_THROW(m.determinant(), hymat::non_exact_division);
}

TEST(DeterminantTest, Complex) {
  Matrix m{{Complex(1, 1), Complex(2, 0)}, {Complex(3, 0), Complex(4, -1)}};
  Complex det = std::get<Complex>(m.determinant());
  EXPECT_NEAR(det.real(), -1.0, 1e-12);
  EXPECT_NEAR(det.imag(), 3.0, 1e-12);
}

TEST(DeterminantTest, RowSwapFlipsSign) {
  Matrix real{{0.0, 1.0}, {1.0, 0.0}};
  EXPECT_NEAR(std::get<Real>(real.determinant()), -1.0, 1e-12);

  Matrix ints{{Integer(0), Integer(1)}, {Integer(1), Integer(0)}};
  EXPECT_EQ(std::get<Integer>(ints.determinant()), Integer(-1));

  Matrix a{{1.0, 2.0, 0.5}, {3.0, 4.0, -1.0}, {2.0, 0.0, 1.0}};
  Matrix swapped{{3.0, 4.0, -1.0}, {1.0, 2.0, 0.5}, {2.0, 0.0, 1.0}};
  EXPECT_NEAR(std::get<Real>(swapped.determinant()),
              -std::get<Real>(a.determinant()), 1e-12);
}

TEST(DeterminantTest, SingularIsZero) {
  Matrix real{{1.0, 2.0}, {2.0, 4.0}};
  EXPECT_NEAR(std::get<Real>(real.determinant()), 0.0, 1e-12);

  Matrix ints{{Integer(1), Integer(2)}, {Integer(2), Integer(4)}};
  EXPECT_EQ(std::get<Integer>(ints.determinant()), Integer(0));

  Matrix zero(size_t(3), size_t(3));
  EXPECT_NEAR(std::get<Real>(zero.determinant()), 0.0, 1e-12);
}

TEST(DeterminantTest, IdentityIsOne) {
  EXPECT_NEAR(std::get<Real>(Matrix::identity(4).determinant()), 1.0, 1e-12);
  EXPECT_EQ(std::get<Integer>(
                Matrix::identity(4, NumericMode::ArbitraryInteger)
                    .determinant()),
            Integer(1));
  Complex c =
      std::get<Complex>(Matrix::identity(4, NumericMode::Complex).determinant());
  EXPECT_NEAR(c.real(), 1.0, 1e-12);
  EXPECT_NEAR(c.imag(), 0.0, 1e-12);
}

TEST(DeterminantTest, NonSquareThrows) {
  Matrix m(size_t(2), size_t(3));
  EXPECT_THROW(m.determinant(), hymat::not_square);
}

TEST(DeterminantTest, SourceIsNotModified) {
  Matrix m{{0.0, 2.0}, {3.0, 4.0}};
  m.determinant();
  EXPECT_DOUBLE_EQ(real_at(m, 0, 0), 0.0);
  EXPECT_DOUBLE_EQ(real_at(m, 1, 0), 3.0);
}

// ===== Inverse =====

TEST(InverseTest, RealTwoByTwo) {
  Matrix m{{1.0, 2.0}, {3.0, 4.0}};
  Matrix inv = m.inverse();
  EXPECT_EQ(inv.mode(), NumericMode::Real);
  EXPECT_NEAR(real_at(inv, 0, 0), -2.0, 1e-12);
  EXPECT_NEAR(real_at(inv, 0, 1), 1.0, 1e-12);
  EXPECT_NEAR(real_at(inv, 1, 0), 1.5, 1e-12);
  EXPECT_NEAR(real_at(inv, 1, 1), -0.5, 1e-12);

  EXPECT_TRUE((m * inv).equals(Matrix::identity(2)));
}

TEST(InverseTest, NeedsRowSwap) {
  Matrix m{{0.0, 2.0, 1.0}, {1.0, 0.0, 0.0}, {3.0, 0.0, 1.0}};
  Matrix inv = m.inverse();
  EXPECT_TRUE((m * inv).equals(Matrix::identity(3)));
  EXPECT_TRUE((inv * m).equals(Matrix::identity(3)));
}

TEST(InverseTest, Complex) {
  Matrix c{{Complex(1, 1), Complex(2, 0)}, {Complex(3, 0), Complex(4, -1)}};
  Matrix inv = c.inverse();
  EXPECT_EQ(inv.mode(), NumericMode::Complex);
  EXPECT_TRUE((c * inv).equals(Matrix::identity(2, NumericMode::Complex)));
}

TEST(InverseTest, IntegerUnsupported) {
  Matrix m{{Integer(1), Integer(0)}, {Integer(0), Integer(1)}};
  EXPECT_THROW(m.inverse(), hymat::unsupported_operation);
}

TEST(InverseTest, SingularThrows) {
  Matrix m{{1.0, 2.0}, {2.0, 4.0}};
  EXPECT_THROW(m.inverse(), hymat::singular_matrix);

  Matrix c{{Complex(1, 1), Complex(2, 2)}, {Complex(1, 0), Complex(2, 0)}};
  EXPECT_THROW(c.inverse(), hymat::singular_matrix);
}

TEST(InverseTest, NonSquareThrows) {
  Matrix m(size_t(3), size_t(2), Entry{1.0});
  EXPECT_THROW(m.inverse(), hymat::not_square);
}

// ===== Rank =====

TEST(RankTest, FullRank) {
  EXPECT_EQ(Matrix::identity(3).rank(), size_t(3));
  Matrix m{{1.0, 2.0, 3.0}, {4.0, 5.0, 6.0}};
  EXPECT_EQ(m.rank(), size_t(2));
  EXPECT_EQ(m.transpose().rank(), size_t(2));
}

TEST(RankTest, Deficient) {
  Matrix m{{1.0, 2.0}, {2.0, 4.0}};
  EXPECT_EQ(m.rank(), size_t(1));

  Matrix three{{1.0, 2.0, 3.0}, {2.0, 4.0, 6.0}, {1.0, 0.0, 1.0}};
  EXPECT_EQ(three.rank(), size_t(2));

  // Leading zero column
  Matrix shifted{{0.0, 1.0, 2.0}, {0.0, 2.0, 4.0}};
  EXPECT_EQ(shifted.rank(), size_t(1));
}

TEST(RankTest, ZeroMatrix) {
  Matrix zero(size_t(2), size_t(3));
  EXPECT_EQ(zero.rank(), size_t(0));
}

TEST(RankTest, IntegerNeverDivides) {
  Matrix dependent{{Integer(2), Integer(4)}, {Integer(1), Integer(2)}};
  EXPECT_EQ(dependent.rank(), size_t(1));

  // Would need 1/2 as a multiplier
  Matrix full{{Integer(2), Integer(1)}, {Integer(1), Integer(1)}};
  EXPECT_EQ(full.rank(), size_t(2));
}

TEST(RankTest, Complex) {
  Matrix c{{Complex(1, 0), Complex(0, 1)}, {Complex(0, 1), Complex(-1, 0)}};
  EXPECT_EQ(c.rank(), size_t(1));
  EXPECT_EQ(Matrix::identity(2, NumericMode::Complex).rank(), size_t(2));
}

TEST(RankTest, Tolerance) {
  Matrix m{{1.0, 1.0}, {1.0, 1.0 + 1e-12}};
  EXPECT_EQ(m.rank(), size_t(1));
  EXPECT_EQ(m.rank(1e-15), size_t(2));
}

// ===== Classification =====

TEST(ClassifyTest, Labels) {
  EXPECT_EQ(Matrix(size_t(2), size_t(2)).type(), "Zero Matrix");
  EXPECT_EQ(Matrix::identity(3).type(), "Identity Matrix");
  EXPECT_EQ((Matrix{{2.0, 0.0}, {0.0, 3.0}}).type(), "Diagonal Matrix");
  EXPECT_EQ((Matrix{{1.0, 2.0}, {0.0, 3.0}}).type(),
            "Upper Triangular Matrix");
  EXPECT_EQ((Matrix{{1.0, 0.0}, {2.0, 3.0}}).type(),
            "Lower Triangular Matrix");
  EXPECT_EQ((Matrix{{1.0, 2.0, 3.0}}).type(), "Row Matrix");
  EXPECT_EQ((Matrix{{1.0}, {2.0}}).type(), "Column Matrix");
  EXPECT_EQ((Matrix{{1.0, 2.0}, {3.0, 4.0}}).type(), "Square Matrix");
  EXPECT_EQ((Matrix{{1.0, 2.0, 3.0}, {4.0, 5.0, 6.0}}).type(),
            "Rectangular Matrix (General)");
}

TEST(ClassifyTest, FirstMatchWins) {
  // Scalar matrices are also diagonal
  Matrix scalar{{5.0, 0.0}, {0.0, 5.0}};
  EXPECT_TRUE(scalar.is_scalar_matrix());
  EXPECT_EQ(scalar.classify(), MatrixType::Diagonal);

  // A real symmetric matrix equals its conjugate transpose
  Matrix sym{{1.0, 2.0}, {2.0, 3.0}};
  EXPECT_TRUE(sym.is_symmetric());
  EXPECT_EQ(sym.classify(), MatrixType::Hermitian);

  Matrix single{{7.0}};
  EXPECT_EQ(single.classify(), MatrixType::Diagonal);
}

TEST(ClassifyTest, ComplexHermitianAndSymmetric) {
  Matrix h{{Complex(2, 0), Complex(1, -1)}, {Complex(1, 1), Complex(3, 0)}};
  EXPECT_TRUE(h.is_hermitian());
  EXPECT_FALSE(h.is_symmetric());
  EXPECT_EQ(h.type(), "Hermitian Matrix");

  Matrix h2{{Complex(1, 0), Complex(2, 1)}, {Complex(2, -1), Complex(3, 0)}};
  EXPECT_EQ(h2.type(), "Hermitian Matrix");

  Matrix s{{Complex(1, 0), Complex(0, 1)}, {Complex(0, 1), Complex(2, 0)}};
  EXPECT_FALSE(s.is_hermitian());
  EXPECT_TRUE(s.is_symmetric());
  EXPECT_EQ(s.type(), "Symmetric Matrix");

  // Non-real diagonal is never Hermitian
  Matrix d{{Complex(0, 1), Complex(0, 0)}, {Complex(0, 0), Complex(1, 0)}};
  EXPECT_FALSE(d.is_hermitian());
}

TEST(ClassifyTest, IntegerMode) {
  EXPECT_EQ(Matrix::identity(2, NumericMode::ArbitraryInteger).type(),
            "Identity Matrix");
  Matrix upper{{Integer(1), Integer(9)}, {Integer(0), Integer(1)}};
  EXPECT_EQ(upper.classify(), MatrixType::UpperTriangular);
}

TEST(ClassifyTest, Predicates) {
  Matrix rect(size_t(2), size_t(3));
  EXPECT_FALSE(rect.is_square());
  EXPECT_FALSE(rect.is_identity());
  EXPECT_FALSE(rect.is_diagonal());
  EXPECT_FALSE(rect.is_symmetric());
  EXPECT_FALSE(rect.is_upper_triangular());
  EXPECT_TRUE(rect.is_zero_matrix());

  Matrix near_id{{1.0 + 1e-12, 0.0}, {1e-12, 1.0}};
  EXPECT_TRUE(near_id.is_identity());
}

TEST(OrthogonalTest, RealAndUnitary) {
  EXPECT_TRUE(Matrix::identity(3).is_orthogonal());

  Matrix rotation{{0.0, -1.0}, {1.0, 0.0}};
  EXPECT_TRUE(rotation.is_orthogonal());

  Matrix general{{1.0, 2.0}, {3.0, 4.0}};
  EXPECT_FALSE(general.is_orthogonal());

  Matrix rect(size_t(2), size_t(3));
  EXPECT_FALSE(rect.is_orthogonal());

  const double s = 1.0 / std::sqrt(2.0);
  Matrix unitary{{Complex(s, 0), Complex(0, s)}, {Complex(0, s), Complex(s, 0)}};
  EXPECT_TRUE(unitary.is_orthogonal());
}

TEST(OrthogonalTest, IntegerModeThrows) {
  EXPECT_THROW(Matrix::identity(2, NumericMode::ArbitraryInteger)
                   .is_orthogonal(),
               hymat::unsupported_operation);

  Matrix rect{{Integer(1), Integer(0), Integer(0)}};
  EXPECT_THROW(rect.is_orthogonal(), hymat::unsupported_operation);
}
