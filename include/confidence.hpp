#pragma once

// Per-field confidences, each in [0, 1].
struct ConfidenceInputs {
  double supplier = 0.0;
  double date = 0.0;
  double invoiceNumber = 0.0;
  double items = 0.0;
  double gstin = 0.0;
};

constexpr double kSupplierWeight = 0.25;
constexpr double kDateWeight = 0.20;
constexpr double kInvoiceNumberWeight = 0.15;
constexpr double kItemsWeight = 0.25;
constexpr double kGstinWeight = 0.15;

// Weighted sum of the field confidences, clamped to [0, 1].
double aggregateConfidence(const ConfidenceInputs& inputs);
