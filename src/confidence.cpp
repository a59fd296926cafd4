#include "confidence.hpp"

#include <algorithm>

double aggregateConfidence(const ConfidenceInputs& inputs) {
  double score = inputs.supplier * kSupplierWeight +
                 inputs.date * kDateWeight +
                 inputs.invoiceNumber * kInvoiceNumberWeight +
                 inputs.items * kItemsWeight +
                 inputs.gstin * kGstinWeight;
  return std::max(0.0, std::min(1.0, score));
}
