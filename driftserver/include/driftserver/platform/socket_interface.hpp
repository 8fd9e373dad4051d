#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "driftserver/export.hpp"

namespace driftserver {
namespace platform {

// エンドポイント情報(IPアドレスとポート)
struct Endpoint {
  std::string address;  // IPv4アドレス文字列 (例: "192.168.1.1")
  uint16_t port;

  Endpoint() : port(0) {}
  Endpoint(const std::string& addr, uint16_t p) : address(addr), port(p) {}
};

// プラットフォーム非依存のデータグラムソケットインターフェース
class ISocket {
 public:
  virtual ~ISocket() = default;

  // ソケットの初期化
  // 戻り値: 成功時true、失敗時false
  virtual bool Initialize() = 0;

  // 指定ポートにバインド(0 = OSが選択)
  // 戻り値: 成功時true、失敗時false
  virtual bool Bind(uint16_t port) = 0;

  // 既定の送信先を固定し、それ以外からの受信を破棄する
  // to: 接続先エンドポイント(数値IPv4)
  // 戻り値: 成功時true、失敗時false
  virtual bool Connect(const Endpoint& to) = 0;

  // 受信可能データの待機(タイムアウト付き)
  // timeout_us: タイムアウト時間(マイクロ秒)
  // 戻り値: データ受信可能な場合true、タイムアウトまたはエラー時false
  virtual bool WaitReadable(int64_t timeout_us) = 0;

  // データグラムの受信
  // from: 送信元エンドポイント情報を格納(出力パラメータ、nullptr可)
  // data: 受信データを格納するバッファ(出力パラメータ)
  // max_size: 受信する最大サイズ(バイト)
  // 戻り値: 成功時true、失敗時false
  virtual bool Receive(Endpoint* from, std::vector<uint8_t>* data,
                       size_t max_size) = 0;

  // データグラムの送信(宛先指定)
  // 戻り値: 全バイト送信時true、失敗時false
  virtual bool Send(const Endpoint& to, const std::vector<uint8_t>& data) = 0;

  // データグラムの送信(Connect済みの宛先へ)
  // 戻り値: 全バイト送信時true、失敗時false
  virtual bool Send(const std::vector<uint8_t>& data) = 0;

  // 送受信の停止(記述子は保持したまま、待機中の受信を解除する)
  virtual void Shutdown() = 0;

  // ソケットのクローズ
  virtual void Close() = 0;

  // 最後に発生したエラーの説明を取得
  virtual std::string GetLastError() const = 0;

  // ソケットが有効かどうかを確認
  virtual bool IsValid() const = 0;

  // poll()等で多重化待機するためのネイティブ記述子(無効時は-1)
  virtual int NativeHandle() const = 0;

  // バインドされたローカルポート(未バインド時は0)
  virtual uint16_t LocalPort() const = 0;
};

// プラットフォーム固有のソケット実装を生成するファクトリ関数
DRIFT_SERVER_API std::unique_ptr<ISocket> CreatePlatformSocket();

// ホスト名をIPv4エンドポイントへ解決する
// host: ホスト名または数値IPv4
// port: ポート番号
// out: 解決結果(出力パラメータ)
// err: 失敗理由(出力パラメータ、nullptr可)
// 戻り値: 成功時true、失敗時false
DRIFT_SERVER_API bool ResolveEndpoint(const std::string& host, uint16_t port,
                                      Endpoint* out, std::string* err);

}  // namespace platform
}  // namespace driftserver
