#pragma once

#include <stdexcept>
#include <string>

namespace rqz_circle {

// すべての失敗は main まで素通しで伝播させる（途中での回復はしない）
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// 入力の不正（負の距離、点数 < 1、緯度範囲外、設定値の型違いなど）
class InvalidInput : public Error {
public:
    using Error::Error;
};

// 測地計算が有限値を返さなかった
class NumericFailure : public Error {
public:
    using Error::Error;
};

// 出力ファイルの作成・書き込み・確定に失敗
class IoFailure : public Error {
public:
    using Error::Error;
};

} // namespace rqz_circle
