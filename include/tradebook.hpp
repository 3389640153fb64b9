#pragma once

/*
===============================================================================
Tradebook: Public API Entry Point
===============================================================================

Single include for embedding the trade book ledger.

  - Data model        TradeBook, BookKey, Order, OrderRequest
  - Rules             StockCodeSet, Validator
  - Engine            Ledger<Policy> with policy::netting::{SameAction, CrossAction}
  - Pipeline          Processor<Policy, Store>, run_session()
  - Collaborators     storage::CsvBookStore, input::{InteractiveSource, FileSource}
===============================================================================
*/

#include <tradebook/version.hpp>
#include <tradebook/types.hpp>
#include <tradebook/decimal.hpp>
#include <tradebook/error.hpp>
#include <tradebook/trade_book.hpp>
#include <tradebook/order.hpp>
#include <tradebook/order_parser.hpp>
#include <tradebook/stock_code_set.hpp>
#include <tradebook/validator.hpp>
#include <tradebook/policy/netting.hpp>
#include <tradebook/ledger.hpp>
#include <tradebook/storage/status.hpp>
#include <tradebook/storage/book_store.hpp>
#include <tradebook/storage/csv_book_store.hpp>
#include <tradebook/processor.hpp>
#include <tradebook/input/line_source.hpp>
#include <tradebook/input/interactive_source.hpp>
#include <tradebook/input/file_source.hpp>
#include <tradebook/session.hpp>
