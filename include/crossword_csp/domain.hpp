/**
 * @file domain.hpp
 * @brief 単語定義域クラス（Sparse Set ベース）とドメインストア
 */
#ifndef CROSSWORD_CSP_DOMAIN_HPP
#define CROSSWORD_CSP_DOMAIN_HPP

#include <cstddef>
#include <vector>

namespace crossword_csp {

class Puzzle;  // forward declaration

/**
 * @brief 単語IDの定義域を表すクラス
 *
 * Sparse Set を使用し、O(1) での値の存在確認と削除を実現する。
 * 削除は有効範囲 [0, n_) の末尾とのスワップで行うため、
 * 削除の取り消しは n_ を戻すだけで O(1)。
 * 列挙順は Dense 配列の並び順（初期状態では単語ID昇順）。
 */
class Domain {
public:
    using value_type = size_t;

    /**
     * @brief 空の定義域を作成
     */
    Domain() = default;

    /**
     * @brief 単語ID 0..universe-1 を全て含む定義域を作成
     * @param universe 語彙サイズ
     */
    explicit Domain(size_t universe);

    /**
     * @brief 定義域が空かどうか
     */
    bool empty() const { return n_ == 0; }

    /**
     * @brief 定義域のサイズを取得
     */
    size_t size() const { return n_; }

    /**
     * @brief 値が定義域に含まれるか
     */
    bool contains(value_type value) const {
        return value < sparse_.size() && sparse_[value] < n_;
    }

    /**
     * @brief 値を削除
     * @return 値が含まれていて削除されたらtrue
     */
    bool remove(value_type value);

    /**
     * @brief 有効範囲の idx 番目の値を削除
     *
     * 末尾の値が idx に移動するので、走査中の削除では idx を進めないこと。
     */
    void remove_at(size_t idx);

    /**
     * @brief 指定値のみに絞り込む
     * @return 値が定義域に含まれていればtrue
     */
    bool assign(value_type value);

    /**
     * @brief 全ての有効な値を列挙順で取得
     */
    std::vector<value_type> values() const;

    /**
     * @brief 有効範囲の idx 番目の値
     */
    value_type operator[](size_t idx) const { return values_[idx]; }

    /**
     * @brief Dense 配列の有効範囲の先頭ポインタ
     */
    const value_type* begin() const { return values_.data(); }

    /**
     * @brief Dense 配列の有効範囲の末尾ポインタ
     */
    const value_type* end() const { return values_.data() + n_; }

    /**
     * @brief 有効サイズを設定（削除の取り消し用）
     * @pre n は現在のサイズ以上、最後に取り消し点を記録した時のサイズ以下
     */
    void set_n(size_t n);

private:
    void swap_at(size_t i, size_t j);

    std::vector<value_type> values_;  // Dense 配列
    std::vector<size_t> sparse_;      // sparse_[value] = Dense 配列上の位置
    size_t n_ = 0;                    // 有効な値の数
};

/**
 * @brief スロットごとの定義域を保持するストア
 *
 * 1回の求解ごとに作成され、ノード整合・アーク整合で単調に縮小する。
 */
class DomainStore {
public:
    DomainStore() = default;

    /**
     * @brief 全スロットの定義域を語彙全体で初期化
     */
    explicit DomainStore(const Puzzle& puzzle);

    /**
     * @brief スロット数を取得
     */
    size_t size() const { return domains_.size(); }

    Domain& operator[](size_t slot_idx) { return domains_[slot_idx]; }
    const Domain& operator[](size_t slot_idx) const { return domains_[slot_idx]; }

    /**
     * @brief 全スロットの定義域サイズの合計
     */
    size_t total_size() const;

    /**
     * @brief 空の定義域を持つスロットがあるか
     */
    bool has_empty() const;

    /**
     * @brief 現在の各定義域サイズを記録する（取り消し点）
     */
    std::vector<size_t> snapshot() const;

    /**
     * @brief snapshot() 時点まで削除を取り消す
     */
    void restore(const std::vector<size_t>& sizes);

private:
    std::vector<Domain> domains_;
};

} // namespace crossword_csp

#endif // CROSSWORD_CSP_DOMAIN_HPP
